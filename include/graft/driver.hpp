// Patch application driver: all deletions, then all updates, then all insertions.
#pragma once
#include "graft/forest.hpp"
#include "graft/ops/context.hpp"
#include "graft/options.hpp"
#include "graft/patch.hpp"
#include <vector>

namespace graft {

using ops::ApplyStats;

class PatchApplier {
public:
    PatchApplier(Forest& forest, const Schema& schema, ApplyOptions opts = ApplyOptions::from_env())
        : forest_(forest), schema_(schema), opts_(opts) {}

    // Mutates the previous revision in place. The first failing patch throws a patch_error and
    // leaves the forest partially patched; it must not be reused after that.
    ApplyStats apply(const std::vector<DeletePatch>& deletes,
                     const std::vector<UpdatePatch>& updates,
                     const std::vector<InsertPatch>& inserts);
    ApplyStats apply(const PatchSet& patches) { return apply(patches.deletes, patches.updates, patches.inserts); }

    // Insertions into the same ordered container (same target, same role) sorted by ascending
    // position, each group staying in the places its members held in the input.
    static std::vector<InsertPatch> insertion_order(const Forest& forest, std::vector<InsertPatch> inserts);

private:
    Forest& forest_;
    const Schema& schema_;
    ApplyOptions opts_;
    void warn_duplicate_thrown(const std::vector<InsertPatch>& inserts) const;
};

} // namespace graft
