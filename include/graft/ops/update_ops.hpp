#pragma once

#include "graft/ops/context.hpp"
#include "graft/patch.hpp"

namespace graft::ops::update_ops {

// Put new_node into the exact place old_node occupies (same index, slot key or set membership).
// new_node is moved, not copied: if it still hangs in the new revision it is taken from there.
void apply(Context C, const UpdatePatch& p);

} // namespace graft::ops::update_ops
