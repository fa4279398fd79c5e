#pragma once

#include "graft/forest.hpp"
#include "graft/options.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace graft::ops {

struct ApplyStats {
    size_t deleted = 0;
    size_t updated = 0;
    size_t inserted = 0;
    size_t cloned = 0; // nodes allocated by clone-before-insert
};

// Inserted thrown type -> members of its thrown set before the update phase. Updates move
// nodes out of the new revision, so the set is captured before they run.
using ThrownSources = std::map<NodeId, std::vector<NodeId>>;

// Shared by the three appliers; the Forest is mutated in place.
struct Context {
    Forest& F;
    const Schema& schema;
    const ApplyOptions& opts;
    ApplyStats& stats;
    const ThrownSources* thrown_sources = nullptr;
};

} // namespace graft::ops
