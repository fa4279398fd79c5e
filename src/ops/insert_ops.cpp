#include "graft/ops/insert_ops.hpp"
#include "graft/errors.hpp"

namespace graft::ops::insert_ops {

static void require_container(const Context& C, NodeId target, RoleKind kind){
    const auto& tag = C.F.at(target).tag;
    if(!C.schema.accepts(tag, *container_of(kind)))
        throw structural_mismatch_error(target, "insert: '" + tag + "' node #" + std::to_string(target) +
                                                    " cannot hold " + to_string(kind) + " children");
}

static NodeId counted_clone(Context& C, NodeId n){
    size_t before = C.F.size();
    NodeId copy = C.F.clone(n);
    C.stats.cloned += C.F.size() - before;
    return copy;
}

// The inserted node may still be referenced by the new revision, so a copy is attached.
static void insert_ordered(Context& C, const InsertPatch& p, RoleKind kind){
    require_container(C, p.target, kind);
    size_t len = C.F.children(p.target, kind).size();
    if(p.position > len) throw invalid_position_error(p.target, p.position, len);
    NodeId copy = counted_clone(C, p.node);
    trace(C.opts, "[patch][insert] %s node=#%u copy=#%u target=#%u position=%zu\n", to_string(kind), p.node, copy, p.target, p.position);
    C.F.insert_at(p.target, kind, p.position, copy);
}

// No position exists in a set: the target receives the full thrown set of the executable the
// node belongs to in the new revision, replacing whatever it declared before.
static void assign_thrown_set(Context& C, const InsertPatch& p){
    require_container(C, p.target, RoleKind::Thrown);
    std::vector<NodeId> source = C.F.children(C.F.at(p.node).parent, RoleKind::Thrown);
    if(C.thrown_sources){
        auto it = C.thrown_sources->find(p.node);
        if(it != C.thrown_sources->end()) source = it->second;
    }
    std::vector<NodeId> copies;
    copies.reserve(source.size());
    for(NodeId t : source) copies.push_back(counted_clone(C, t));
    trace(C.opts, "[patch][insert] thrown node=#%u target=#%u count=%zu\n", p.node, p.target, copies.size());
    C.F.assign_thrown(p.target, copies);
}

// Slots are overwritten, never merged. A node taken from a multi-valued slot becomes the only
// value of that slot on the target.
static void assign_slot(Context& C, const InsertPatch& p, const std::string& key){
    const Node& target = C.F.at(p.target);
    if(target.props.count(key))
        throw structural_mismatch_error(p.target, "insert: '" + target.tag + "' node #" + std::to_string(p.target) +
                                                      " has a property :" + key + ", not a slot");
    if(C.F.is_ancestor(p.node, p.target))
        throw structural_mismatch_error(p.target, "insert: node #" + std::to_string(p.node) + " would become its own descendant");
    bool multi = C.F.in_multi_slot(p.node);
    C.F.detach(p.node);
    if(multi){
        auto previous = C.F.assign_slot_values(p.target, key, {p.node});
        trace(C.opts, "[patch][insert] slot=%s[] node=#%u target=#%u replaced=%zu\n", key.c_str(), p.node, p.target, previous.size());
    } else {
        NodeId previous = C.F.set_slot(p.target, key, p.node);
        trace(C.opts, "[patch][insert] slot=%s node=#%u target=#%u replaced=#%u\n", key.c_str(), p.node, p.target, previous);
    }
}

void apply(Context C, const InsertPatch& p){
    Role role = C.F.at(p.node).role;
    switch(role.kind){
    case RoleKind::Statement:
    case RoleKind::Argument:
    case RoleKind::TypeMember:
    case RoleKind::TypeParameter:
    case RoleKind::Parameter:
        insert_ordered(C, p, role.kind);
        break;
    case RoleKind::Thrown:
        assign_thrown_set(C, p);
        break;
    case RoleKind::Other:
        if(role.slot.empty())
            throw unsupported_role_error(p.node, "insert: node #" + std::to_string(p.node) + " has a slot role without a key");
        assign_slot(C, p, role.slot);
        break;
    case RoleKind::None:
        throw unsupported_role_error(p.node, "insert: node #" + std::to_string(p.node) + " has no role (root or detached node)");
    }
    ++C.stats.inserted;
}

} // namespace graft::ops::insert_ops
