// Shared fixture for the patch applier suites: one forest holding both revisions.
#pragma once
#include <gtest/gtest.h>
#include "graft/bridge.hpp"
#include "graft/ops/context.hpp"
#include "graft/path.hpp"
#include <string>

class PatchFixture : public ::testing::Test {
protected:
    graft::Forest F;
    graft::Schema schema = graft::Schema::java_like();
    graft::ApplyOptions opts;
    graft::ops::ApplyStats stats;
    graft::NodeId prev = graft::kNoNode;
    graft::NodeId next = graft::kNoNode;

    graft::ops::Context ctx() { return graft::ops::Context{F, schema, opts, stats, nullptr}; }

    void load(const std::string& prev_text, const std::string& new_text){
        prev = graft::load_tree(F, prev_text, "PREV", schema);
        next = graft::load_tree(F, new_text, "NEW", schema);
    }
    graft::NodeId old_at(const std::string& path) const { return graft::resolve_path(F, prev, path); }
    graft::NodeId new_at(const std::string& path) const { return graft::resolve_path(F, next, path); }
    std::string print(graft::NodeId n) const { return graft::print_tree(F, n); }
    std::string name_of(graft::NodeId n) const {
        auto it = F.at(n).props.find("name");
        if(it == F.at(n).props.end()) return {};
        auto* s = graft::edn::as_string(*it->second);
        return s ? *s : std::string{};
    }
    std::vector<std::string> names(graft::NodeId parent, graft::RoleKind k) const {
        std::vector<std::string> out;
        for(auto c : F.children(parent, k)) out.push_back(name_of(c));
        return out;
    }
};
