// Arena holding every node of the trees being patched. Nodes are addressed by NodeId,
// never by value: two structurally identical nodes are still different nodes.
#pragma once
#include "graft/edn.hpp"
#include "graft/role.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace graft
{

    using NodeId = uint32_t;
    inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

    // Where a node was loaded from. Clones keep the origin of the node they copy.
    struct Origin
    {
        std::string source;
        int line = -1;
        int col = -1;
    };

    struct Node
    {
        std::string tag;
        std::map<std::string, edn::node_ptr> props; // scalar attributes (:name "foo")
        NodeId parent = kNoNode;
        Role role;
        Origin origin;
        std::vector<NodeId> statements;
        std::vector<NodeId> arguments;
        std::vector<NodeId> members;
        std::vector<NodeId> type_params;
        std::vector<NodeId> params;
        std::vector<NodeId> thrown; // set semantics, order carries no meaning
        std::map<std::string, NodeId> slots;
        // multi-valued attributes (:modifiers [...]); kept in load order, no positional meaning
        std::map<std::string, std::vector<NodeId>> multi_slots;
    };

    class Forest
    {
    public:
        NodeId create(std::string tag, Origin origin = {});

        Node &at(NodeId id);
        const Node &at(NodeId id) const;
        size_t size() const { return nodes_.size(); }
        bool attached(NodeId id) const { return at(id).parent != kNoNode; }

        // Ordered container (or the thrown set) of `parent` for the given role.
        const std::vector<NodeId> &children(NodeId parent, RoleKind k) const;
        NodeId slot(NodeId parent, const std::string &key) const;
        // Values of a multi-valued slot; empty when the key holds none.
        const std::vector<NodeId> &slot_values(NodeId parent, const std::string &key) const;
        // True when the node is one of the values of a multi-valued slot.
        bool in_multi_slot(NodeId id) const;

        // Structural primitives. They keep parent/role back-references consistent and reject
        // misuse with std::invalid_argument; patch-level validation happens in the appliers.
        void append(NodeId parent, RoleKind k, NodeId child);
        void insert_at(NodeId parent, RoleKind k, size_t pos, NodeId child);
        // Returns the previous occupant (now detached) or kNoNode. Values a multi-valued slot
        // held under the same key are detached too.
        NodeId set_slot(NodeId parent, const std::string &key, NodeId child);
        void insert_slot_value(NodeId parent, const std::string &key, size_t pos, NodeId child);
        // Overwrites the whole value of `key` (single or multi) with `values`; returns the
        // previous values, now detached.
        std::vector<NodeId> assign_slot_values(NodeId parent, const std::string &key, const std::vector<NodeId> &values);
        // Removes `child` from its parent; returns the index it had (0 for single-valued slots).
        size_t detach(NodeId child);
        // Puts `replacement` into the exact place `old` occupies; `old` ends up detached.
        void replace(NodeId old, NodeId replacement);
        // Replaces the whole thrown set of `parent`; previous members end up detached.
        void assign_thrown(NodeId parent, const std::vector<NodeId> &types);

        // Deep copy of the subtree rooted at `id`. The copy is detached and keeps origins.
        NodeId clone(NodeId id);
        // True when `ancestor` is `id` or one of its transitive parents.
        bool is_ancestor(NodeId ancestor, NodeId id) const;
        NodeId root_of(NodeId id) const;
        // All nodes of the subtree in pre-order (node, ordered containers, thrown, slots, multi-valued slots).
        std::vector<NodeId> subtree(NodeId root) const;

    private:
        std::vector<Node> nodes_;
        std::vector<NodeId> &children_mut(NodeId parent, RoleKind k);
        void require_detached(NodeId child, const char *op) const;
        void check_id(NodeId id) const;
    };

    // Which container kinds each tag may own. Slots are allowed on every tag.
    class Schema
    {
    public:
        Schema &allow(const std::string &tag, ContainerKind k)
        {
            tags_[tag] |= static_cast<unsigned>(k);
            return *this;
        }
        bool accepts(const std::string &tag, ContainerKind k) const
        {
            auto it = tags_.find(tag);
            return it != tags_.end() && (it->second & static_cast<unsigned>(k)) != 0;
        }
        bool knows(const std::string &tag) const { return tags_.count(tag) != 0; }

        // Blocks own statements, calls own arguments, types own members, executables own
        // parameters and thrown types.
        static Schema java_like();

    private:
        std::map<std::string, unsigned> tags_;
    };

} // namespace graft
