// Provenance check after patching: every node of the patched tree must come from the previous
// revision unless it lies in a subtree taken from the new one.
#pragma once
#include "graft/forest.hpp"
#include <string>

namespace graft::test_support {

// `from_new` says whether the subtree being walked was taken from the new revision. A thrown
// type counts as new when any of its sibling thrown types does, since the set is assigned whole.
inline bool check_provenance(const Forest& F, NodeId root, bool from_new,
                             const std::string& prev_src, const std::string& new_src, std::string* bad = nullptr){
    const Node& n = F.at(root);
    bool is_new = n.origin.source == new_src;
    if(n.role.kind == RoleKind::Thrown && !is_new){
        for(NodeId sib : F.children(n.parent, RoleKind::Thrown))
            if(F.at(sib).origin.source == new_src) is_new = true;
    }
    if(!from_new && !is_new && n.origin.source != prev_src){
        if(bad) *bad = "node #" + std::to_string(root) + " from unknown source '" + n.origin.source + "'";
        return false;
    }
    if(from_new && !is_new){
        if(bad) *bad = "node #" + std::to_string(root) + " '" + n.tag + "' from " + n.origin.source + " inside a new subtree";
        return false;
    }
    for(NodeId c : F.subtree(root)){
        if(c == root || F.at(c).parent != root) continue;
        if(!check_provenance(F, c, is_new, prev_src, new_src, bad)) return false;
    }
    return true;
}

} // namespace graft::test_support
