#include "graft/path.hpp"
#include "path_grammar.hpp"
#include <algorithm>

namespace graft {

NodePath parse_path(std::string_view text){
    tao::pegtl::memory_input in(text.data(), text.size(), "node-path");
    NodePath out;
    try {
        tao::pegtl::parse< path_front::grammar::path, path_front::actions::action >(in, out);
    } catch(const tao::pegtl::parse_error& e){
        throw path_error("malformed node path '" + std::string(text) + "': " + e.what());
    }
    return out;
}

std::string to_string(const NodePath& p){
    if(p.steps.empty()) return "/";
    std::string out;
    for(auto& s : p.steps){
        out += '/';
        out += s.key;
        if(s.index) out += '[' + std::to_string(*s.index) + ']';
    }
    return out;
}

NodeId resolve_path(const Forest& forest, NodeId root, const NodePath& path){
    NodeId cur = root;
    std::string walked;
    for(auto& s : path.steps){
        walked += '/' + s.key;
        if(auto role = role_for_key(s.key)){
            if(!s.index) throw path_error("step '" + walked + "' needs an index");
            const auto& kids = forest.children(cur, *role);
            if(*s.index >= kids.size())
                throw path_error("step '" + walked + "[" + std::to_string(*s.index) + "]' is out of range (" +
                                 std::to_string(kids.size()) + " children)");
            cur = kids[*s.index];
        } else if(s.index){
            const auto& values = forest.slot_values(cur, s.key);
            if(*s.index >= values.size())
                throw path_error("step '" + walked + "[" + std::to_string(*s.index) + "]' is out of range (" +
                                 std::to_string(values.size()) + " values)");
            cur = values[*s.index];
        } else {
            NodeId next = forest.slot(cur, s.key);
            if(next == kNoNode) throw path_error("no slot '" + walked + "' on '" + forest.at(cur).tag + "'");
            cur = next;
        }
    }
    return cur;
}

NodeId resolve_path(const Forest& forest, NodeId root, std::string_view text){
    return resolve_path(forest, root, parse_path(text));
}

NodePath path_of(const Forest& forest, NodeId node){
    NodePath p;
    for(NodeId cur = node; forest.at(cur).parent != kNoNode; cur = forest.at(cur).parent){
        const Node& n = forest.at(cur);
        if(n.role.kind == RoleKind::Other){
            std::optional<size_t> index;
            if(forest.in_multi_slot(cur)){
                const auto& values = forest.slot_values(n.parent, n.role.slot);
                index = static_cast<size_t>(std::find(values.begin(), values.end(), cur) - values.begin());
            }
            p.steps.push_back(PathStep{n.role.slot, index});
            continue;
        }
        const auto& kids = forest.children(n.parent, n.role.kind);
        auto it = std::find(kids.begin(), kids.end(), cur);
        p.steps.push_back(PathStep{container_key(n.role.kind), static_cast<size_t>(it - kids.begin())});
    }
    std::reverse(p.steps.begin(), p.steps.end());
    return p;
}

} // namespace graft
