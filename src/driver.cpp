#include "graft/driver.hpp"
#include "graft/ops/delete_ops.hpp"
#include "graft/ops/insert_ops.hpp"
#include "graft/ops/update_ops.hpp"
#include <algorithm>
#include <cstdio>
#include <map>
#include <utility>

namespace graft {

std::vector<InsertPatch> PatchApplier::insertion_order(const Forest& forest, std::vector<InsertPatch> inserts){
    std::map<std::pair<NodeId, RoleKind>, std::vector<size_t>> groups;
    for(size_t i = 0; i < inserts.size(); ++i){
        RoleKind k = forest.at(inserts[i].node).role.kind;
        if(is_ordered(k)) groups[{inserts[i].target, k}].push_back(i);
    }
    for(auto& [key, slots] : groups){
        if(slots.size() < 2) continue;
        std::vector<InsertPatch> members;
        members.reserve(slots.size());
        for(size_t s : slots) members.push_back(inserts[s]);
        std::stable_sort(members.begin(), members.end(),
                         [](const InsertPatch& a, const InsertPatch& b){ return a.position < b.position; });
        for(size_t i = 0; i < slots.size(); ++i) inserts[slots[i]] = members[i];
    }
    return inserts;
}

void PatchApplier::warn_duplicate_thrown(const std::vector<InsertPatch>& inserts) const {
    std::map<NodeId, size_t> per_target;
    for(auto& ins : inserts)
        if(forest_.at(ins.node).role.kind == RoleKind::Thrown) ++per_target[ins.target];
    for(auto& [target, count] : per_target)
        if(count > 1)
            std::fprintf(stderr, "[patch][warn] %zu thrown insertions target node #%u; each one replaces the whole set\n", count, target);
}

ApplyStats PatchApplier::apply(const std::vector<DeletePatch>& deletes,
                               const std::vector<UpdatePatch>& updates,
                               const std::vector<InsertPatch>& inserts){
    ApplyStats stats;
    ops::Context C{forest_, schema_, opts_, stats, nullptr};
    trace(opts_, "[patch][begin] deletes=%zu updates=%zu inserts=%zu\n", deletes.size(), updates.size(), inserts.size());
    for(auto& d : deletes) ops::delete_ops::apply(C, d);
    ops::ThrownSources thrown_sources;
    for(auto& i : inserts){
        const Node& n = forest_.at(i.node);
        if(n.role.kind == RoleKind::Thrown) thrown_sources[i.node] = forest_.children(n.parent, RoleKind::Thrown);
    }
    C.thrown_sources = &thrown_sources;
    for(auto& u : updates) ops::update_ops::apply(C, u);
    // Positions refer to the container shape left by the first two phases, so roles and
    // grouping are read only now.
    auto ordered = insertion_order(forest_, inserts);
    if(opts_.warn_duplicate_thrown) warn_duplicate_thrown(ordered);
    for(auto& i : ordered) ops::insert_ops::apply(C, i);
    trace(opts_, "[patch][end] deleted=%zu updated=%zu inserted=%zu cloned=%zu\n", stats.deleted, stats.updated, stats.inserted, stats.cloned);
    return stats;
}

} // namespace graft
