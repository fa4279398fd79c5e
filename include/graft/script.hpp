// Patch scripts: the edit set of one revision pair written with node paths.
//   {:delete ["/members[0]/params[1]"]
//    :update [["/members[0]/body/statements[0]" "/members[0]/body/statements[0]"]]
//    :insert [[2 "/members[0]/body/statements[2]" "/members[0]/body"]]}
// Delete paths, update old paths and insert targets resolve in the previous revision; update
// new paths and inserted nodes in the new one. Everything is resolved before anything applies.
#pragma once
#include "graft/edn.hpp"
#include "graft/forest.hpp"
#include "graft/patch.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace graft {

struct script_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

PatchSet load_script(const Forest& forest, NodeId prev_root, NodeId new_root, const edn::node_ptr& script);
PatchSet load_script(const Forest& forest, NodeId prev_root, NodeId new_root, std::string_view text);

// Inverse of load_script for patches whose nodes are still attached to their trees.
edn::node_ptr to_script(const Forest& forest, const PatchSet& patches);

} // namespace graft
