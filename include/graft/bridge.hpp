// EDN <-> Forest: loading revisions, printing them back, comparing them.
//
// A node is written (tag :key value ...). Scalars are properties, a vector under :statements,
// :args, :members, :type-params or :params is that ordered container, a set under :thrown is
// the thrown set, a single (tag ...) form under any other key fills the slot of that name, and a
// vector of forms under any other key is a multi-valued slot (:modifiers [(public) (static)]).
#pragma once
#include "graft/edn.hpp"
#include "graft/forest.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace graft {

struct bridge_error : std::runtime_error {
    bridge_error(const std::string& msg, int line, int col)
        : std::runtime_error(line >= 0 ? msg + " (line " + std::to_string(line) + ":" + std::to_string(col) + ")" : msg),
          line(line), col(col) {}
    int line;
    int col;
};

// Builds the tree in `forest`; every node records `source` and its EDN position as origin.
NodeId load_tree(Forest& forest, const edn::node_ptr& form, const std::string& source,
                 const Schema& schema = Schema::java_like());
NodeId load_tree(Forest& forest, std::string_view text, const std::string& source,
                 const Schema& schema = Schema::java_like());

// Canonical EDN: properties, then non-empty containers, then slots, then non-empty multi-valued
// slots; thrown types sorted.
edn::node_ptr to_edn(const Forest& forest, NodeId root);
std::string print_tree(const Forest& forest, NodeId root);

// Structural comparison; identity and origin are ignored, thrown sets compare as sets.
bool trees_equal(const Forest& forest, NodeId a, NodeId b);

// {tag [:statements :params ...] ...}
Schema load_schema(std::string_view text);

} // namespace graft
