#pragma once

#include "graft/ops/context.hpp"
#include "graft/patch.hpp"

namespace graft::ops::delete_ops {

// Detach the node from its parent, keeping sibling order. Throws detached_node_error when the
// node has no parent: deleting twice is an error, not a no-op.
void apply(Context C, const DeletePatch& p);

} // namespace graft::ops::delete_ops
