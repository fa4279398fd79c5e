#include "graft/forest.hpp"
#include <algorithm>
#include <stdexcept>

namespace graft {

namespace {
const RoleKind kContainerRoles[] = {RoleKind::Statement, RoleKind::Argument, RoleKind::TypeMember,
                                    RoleKind::TypeParameter, RoleKind::Parameter, RoleKind::Thrown};
}

NodeId Forest::create(std::string tag, Origin origin)
{
    Node n;
    n.tag = std::move(tag);
    n.origin = std::move(origin);
    nodes_.push_back(std::move(n));
    return static_cast<NodeId>(nodes_.size() - 1);
}

void Forest::check_id(NodeId id) const
{
    if (id >= nodes_.size())
        throw std::out_of_range("node #" + std::to_string(id) + " does not exist");
}

Node &Forest::at(NodeId id)
{
    check_id(id);
    return nodes_[id];
}

const Node &Forest::at(NodeId id) const
{
    check_id(id);
    return nodes_[id];
}

std::vector<NodeId> &Forest::children_mut(NodeId parent, RoleKind k)
{
    auto &n = at(parent);
    switch (k)
    {
    case RoleKind::Statement: return n.statements;
    case RoleKind::Argument: return n.arguments;
    case RoleKind::TypeMember: return n.members;
    case RoleKind::TypeParameter: return n.type_params;
    case RoleKind::Parameter: return n.params;
    case RoleKind::Thrown: return n.thrown;
    case RoleKind::None:
    case RoleKind::Other:
        break;
    }
    throw std::invalid_argument(std::string("role '") + to_string(k) + "' has no container");
}

const std::vector<NodeId> &Forest::children(NodeId parent, RoleKind k) const
{
    return const_cast<Forest *>(this)->children_mut(parent, k);
}

NodeId Forest::slot(NodeId parent, const std::string &key) const
{
    auto &slots = at(parent).slots;
    auto it = slots.find(key);
    return it == slots.end() ? kNoNode : it->second;
}

const std::vector<NodeId> &Forest::slot_values(NodeId parent, const std::string &key) const
{
    static const std::vector<NodeId> none;
    auto &multi = at(parent).multi_slots;
    auto it = multi.find(key);
    return it == multi.end() ? none : it->second;
}

bool Forest::in_multi_slot(NodeId id) const
{
    const Node &n = at(id);
    if (n.parent == kNoNode || n.role.kind != RoleKind::Other)
        return false;
    const auto &values = slot_values(n.parent, n.role.slot);
    return std::find(values.begin(), values.end(), id) != values.end();
}

void Forest::require_detached(NodeId child, const char *op) const
{
    if (at(child).parent != kNoNode)
        throw std::invalid_argument(std::string(op) + ": node #" + std::to_string(child) + " is already attached");
}

void Forest::append(NodeId parent, RoleKind k, NodeId child)
{
    insert_at(parent, k, children(parent, k).size(), child);
}

void Forest::insert_at(NodeId parent, RoleKind k, size_t pos, NodeId child)
{
    require_detached(child, "insert_at");
    auto &kids = children_mut(parent, k);
    if (pos > kids.size())
        throw std::invalid_argument("insert_at: position " + std::to_string(pos) + " past end");
    kids.insert(kids.begin() + static_cast<std::ptrdiff_t>(pos), child);
    auto &c = at(child);
    c.parent = parent;
    c.role = Role::of(k);
}

NodeId Forest::set_slot(NodeId parent, const std::string &key, NodeId child)
{
    require_detached(child, "set_slot");
    NodeId previous = slot(parent, key);
    if (previous != kNoNode)
        detach(previous);
    std::vector<NodeId> values = slot_values(parent, key);
    for (NodeId v : values)
        detach(v);
    at(parent).multi_slots.erase(key);
    at(parent).slots[key] = child;
    auto &c = at(child);
    c.parent = parent;
    c.role = Role::in_slot(key);
    return previous;
}

void Forest::insert_slot_value(NodeId parent, const std::string &key, size_t pos, NodeId child)
{
    require_detached(child, "insert_slot_value");
    if (slot(parent, key) != kNoNode)
        throw std::invalid_argument("insert_slot_value: slot '" + key + "' of node #" + std::to_string(parent) +
                                    " is single-valued");
    auto &values = at(parent).multi_slots[key];
    if (pos > values.size())
        throw std::invalid_argument("insert_slot_value: position " + std::to_string(pos) + " past end");
    values.insert(values.begin() + static_cast<std::ptrdiff_t>(pos), child);
    auto &c = at(child);
    c.parent = parent;
    c.role = Role::in_slot(key);
}

std::vector<NodeId> Forest::assign_slot_values(NodeId parent, const std::string &key, const std::vector<NodeId> &values)
{
    for (NodeId v : values)
        require_detached(v, "assign_slot_values");
    std::vector<NodeId> previous = slot_values(parent, key);
    for (NodeId v : previous)
        detach(v);
    if (NodeId single = slot(parent, key); single != kNoNode)
    {
        detach(single);
        previous.push_back(single);
    }
    // an empty value still records the key as multi-valued
    at(parent).multi_slots[key];
    for (size_t i = 0; i < values.size(); ++i)
        insert_slot_value(parent, key, i, values[i]);
    return previous;
}

size_t Forest::detach(NodeId child)
{
    auto &c = at(child);
    if (c.parent == kNoNode)
        throw std::invalid_argument("detach: node #" + std::to_string(child) + " has no parent");
    NodeId parent = c.parent;
    size_t index = 0;
    if (c.role.kind == RoleKind::Other)
    {
        auto &slots = at(parent).slots;
        auto it = slots.find(c.role.slot);
        if (it != slots.end() && it->second == child)
        {
            slots.erase(it);
        }
        else
        {
            auto &values = at(parent).multi_slots[c.role.slot];
            auto pos = std::find(values.begin(), values.end(), child);
            if (pos == values.end())
                throw std::logic_error("detach: slot '" + c.role.slot + "' does not hold node #" + std::to_string(child));
            index = static_cast<size_t>(pos - values.begin());
            values.erase(pos);
        }
    }
    else
    {
        auto &kids = children_mut(parent, c.role.kind);
        auto it = std::find(kids.begin(), kids.end(), child);
        if (it == kids.end())
            throw std::logic_error("detach: node #" + std::to_string(child) + " missing from its parent container");
        index = static_cast<size_t>(it - kids.begin());
        kids.erase(it);
    }
    c.parent = kNoNode;
    c.role = Role::none();
    return index;
}

void Forest::replace(NodeId old, NodeId replacement)
{
    if (old == replacement)
        return;
    if (!attached(old))
        throw std::invalid_argument("replace: node #" + std::to_string(old) + " has no parent");
    if (is_ancestor(replacement, old))
        throw std::invalid_argument("replace: node #" + std::to_string(replacement) + " contains node #" +
                                    std::to_string(old));
    // Ownership transfer: the replacement leaves wherever it was first, so an index taken
    // afterwards already accounts for it when both share a container.
    if (attached(replacement))
        detach(replacement);
    NodeId parent = at(old).parent;
    Role role = at(old).role;
    if (role.kind == RoleKind::Other)
    {
        bool multi = in_multi_slot(old);
        size_t index = detach(old);
        if (multi)
            insert_slot_value(parent, role.slot, index, replacement);
        else
            set_slot(parent, role.slot, replacement);
        return;
    }
    size_t index = detach(old);
    insert_at(parent, role.kind, index, replacement);
}

void Forest::assign_thrown(NodeId parent, const std::vector<NodeId> &types)
{
    for (NodeId t : types)
        require_detached(t, "assign_thrown");
    auto previous = at(parent).thrown;
    for (NodeId t : previous)
        detach(t);
    for (NodeId t : types)
        append(parent, RoleKind::Thrown, t);
}

NodeId Forest::clone(NodeId id)
{
    check_id(id);
    // nodes_ may reallocate while copying, so nothing below holds a Node reference across create()
    NodeId copy = create(at(id).tag, at(id).origin);
    at(copy).props = at(id).props;
    for (RoleKind k : kContainerRoles)
    {
        std::vector<NodeId> kids = children(id, k);
        for (NodeId kid : kids)
            append(copy, k, clone(kid));
    }
    std::map<std::string, NodeId> slots = at(id).slots;
    for (auto &[key, kid] : slots)
        set_slot(copy, key, clone(kid));
    std::map<std::string, std::vector<NodeId>> multi = at(id).multi_slots;
    for (auto &[key, values] : multi)
    {
        std::vector<NodeId> copies;
        for (NodeId v : values)
            copies.push_back(clone(v));
        assign_slot_values(copy, key, copies);
    }
    return copy;
}

bool Forest::is_ancestor(NodeId ancestor, NodeId id) const
{
    for (NodeId cur = id; cur != kNoNode; cur = at(cur).parent)
        if (cur == ancestor)
            return true;
    return false;
}

NodeId Forest::root_of(NodeId id) const
{
    NodeId cur = id;
    while (at(cur).parent != kNoNode)
        cur = at(cur).parent;
    return cur;
}

std::vector<NodeId> Forest::subtree(NodeId root) const
{
    std::vector<NodeId> out;
    std::vector<NodeId> stack{root};
    while (!stack.empty())
    {
        NodeId cur = stack.back();
        stack.pop_back();
        out.push_back(cur);
        const auto &n = at(cur);
        // push in reverse so the walk visits containers in declaration order
        for (auto it = n.multi_slots.rbegin(); it != n.multi_slots.rend(); ++it)
            for (auto v = it->second.rbegin(); v != it->second.rend(); ++v)
                stack.push_back(*v);
        for (auto it = n.slots.rbegin(); it != n.slots.rend(); ++it)
            stack.push_back(it->second);
        for (auto k = std::rbegin(kContainerRoles); k != std::rend(kContainerRoles); ++k)
        {
            const auto &kids = children(cur, *k);
            for (auto it = kids.rbegin(); it != kids.rend(); ++it)
                stack.push_back(*it);
        }
    }
    return out;
}

Schema Schema::java_like()
{
    Schema s;
    for (const char *t : {"block", "case", "statement-list"})
        s.allow(t, ContainerKind::Statements);
    for (const char *t : {"invocation", "new", "constructor-call"})
        s.allow(t, ContainerKind::Arguments);
    s.allow("compilation-unit", ContainerKind::TypeMembers);
    for (const char *t : {"class", "interface", "enum", "record"})
        s.allow(t, ContainerKind::TypeMembers).allow(t, ContainerKind::TypeParameters);
    for (const char *t : {"method", "constructor"})
        s.allow(t, ContainerKind::TypeParameters).allow(t, ContainerKind::Parameters).allow(t, ContainerKind::ThrownSet);
    s.allow("lambda", ContainerKind::Parameters);
    return s;
}

} // namespace graft
