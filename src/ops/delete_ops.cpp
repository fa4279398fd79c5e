#include "graft/ops/delete_ops.hpp"
#include "graft/errors.hpp"

namespace graft::ops::delete_ops {

void apply(Context C, const DeletePatch& p){
    auto& F = C.F;
    if(!F.attached(p.node)) throw detached_node_error(p.node, "delete");
    const Node& n = F.at(p.node);
    trace(C.opts, "[patch][delete] node=#%u tag=%s parent=#%u role=%s\n", p.node, n.tag.c_str(), n.parent, to_string(n.role).c_str());
    F.detach(p.node);
    ++C.stats.deleted;
}

} // namespace graft::ops::delete_ops
