#pragma once

#include "graft/ops/context.hpp"
#include "graft/patch.hpp"

namespace graft::ops::insert_ops {

// Dispatch on the role the node has in the new revision:
//   Statement/Argument/TypeMember/TypeParameter/Parameter - clone, insert at position
//   Thrown - copy the whole thrown set of the node's executable onto the target (as captured in
//            C.thrown_sources when present)
//   Other  - move the node into the slot of the same key on the target, overwriting its value
void apply(Context C, const InsertPatch& p);

} // namespace graft::ops::insert_ops
