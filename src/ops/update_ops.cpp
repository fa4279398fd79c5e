#include "graft/ops/update_ops.hpp"
#include "graft/errors.hpp"

namespace graft::ops::update_ops {

void apply(Context C, const UpdatePatch& p){
    auto& F = C.F;
    if(!F.attached(p.old_node)) throw detached_node_error(p.old_node, "update");
    if(p.old_node == p.new_node) return;
    if(F.is_ancestor(p.new_node, p.old_node))
        throw structural_mismatch_error(p.old_node, "update: replacement node #" + std::to_string(p.new_node) +
                                                        " contains node #" + std::to_string(p.old_node));
    const Node& o = F.at(p.old_node);
    trace(C.opts, "[patch][update] old=#%u tag=%s new=#%u tag=%s parent=#%u role=%s moved=%d\n", p.old_node, o.tag.c_str(),
          p.new_node, F.at(p.new_node).tag.c_str(), o.parent, to_string(o.role).c_str(), F.attached(p.new_node) ? 1 : 0);
    F.replace(p.old_node, p.new_node);
    ++C.stats.updated;
}

} // namespace graft::ops::update_ops
