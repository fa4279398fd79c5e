// EDN values used as the interchange format for program trees and patch scripts
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace graft::edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col)), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct set
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one form; trailing non-whitespace input is an error.
    node_ptr parse(std::string_view src);

    std::string to_string(const node_ptr &n);
    // Multi-line rendering: collections nest one element per line once they stop fitting inline.
    std::string to_pretty_string(const node_ptr &n, int indentWidth = 2);

    // Structural equality; sets and maps compare without regard to order, positions are ignored.
    bool equal(const node_ptr &a, const node_ptr &b);

    inline bool is_atom(const node &n)
    {
        return !std::holds_alternative<list>(n.data) && !std::holds_alternative<vector_t>(n.data) &&
               !std::holds_alternative<set>(n.data) && !std::holds_alternative<map>(n.data);
    }
    inline const list *as_list(const node &n) { return std::get_if<list>(&n.data); }
    inline const vector_t *as_vector(const node &n) { return std::get_if<vector_t>(&n.data); }
    inline const set *as_set(const node &n) { return std::get_if<set>(&n.data); }
    inline const map *as_map(const node &n) { return std::get_if<map>(&n.data); }
    inline const symbol *as_symbol(const node &n) { return std::get_if<symbol>(&n.data); }
    inline const keyword *as_keyword(const node &n) { return std::get_if<keyword>(&n.data); }
    inline const std::string *as_string(const node &n) { return std::get_if<std::string>(&n.data); }
    inline const int64_t *as_int(const node &n) { return std::get_if<int64_t>(&n.data); }

    // Factory helpers
    inline node_ptr make(node_data d) { return std::make_shared<node>(node{std::move(d)}); }
    inline node_ptr n_sym(std::string name) { return make(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return make(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return make(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return make(v); }

    // Map lookup by keyword name, nullptr when absent.
    inline node_ptr find_key(const map &m, std::string_view key)
    {
        for (auto &kv : m.entries)
        {
            auto *k = as_keyword(*kv.first);
            if (k && k->name == key)
                return kv.second;
        }
        return nullptr;
    }

} // namespace graft::edn
