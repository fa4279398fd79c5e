// Node paths: "/members[0]/body/statements[2]" addresses a node from the root of its tree.
// Container steps carry an index (thrown indices follow stored order), as do steps into a
// multi-valued slot (/modifiers[1]); single-valued slot steps do not.
#pragma once
#include "graft/forest.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace graft {

struct path_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct PathStep {
    std::string key;
    std::optional<size_t> index;
    bool operator==(const PathStep& o) const { return key == o.key && index == o.index; }
};

struct NodePath {
    std::vector<PathStep> steps; // empty: the root itself
    bool operator==(const NodePath& o) const { return steps == o.steps; }
};

NodePath parse_path(std::string_view text);
std::string to_string(const NodePath& p);

NodeId resolve_path(const Forest& forest, NodeId root, const NodePath& path);
NodeId resolve_path(const Forest& forest, NodeId root, std::string_view text);

// Path from the root of the node's tree down to the node.
NodePath path_of(const Forest& forest, NodeId node);

} // namespace graft
