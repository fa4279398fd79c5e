// Structural equality for EDN values.
#include "graft/edn.hpp"
#include <vector>

namespace graft::edn {

namespace {

bool equal_unordered(const std::vector<node_ptr> &le, const std::vector<node_ptr> &re);

bool equal_impl(const node_ptr &a, const node_ptr &b)
{
    if (a.get() == b.get())
        return true;
    if (!a || !b)
        return false;
    if (a->data.index() != b->data.index())
        return false;

    struct Visitor
    {
        const node &b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool v) const { return v == std::get<bool>(b.data); }
        bool operator()(int64_t v) const { return v == std::get<int64_t>(b.data); }
        bool operator()(double v) const { return v == std::get<double>(b.data); }
        bool operator()(const std::string &v) const { return v == std::get<std::string>(b.data); }
        bool operator()(const keyword &v) const { return v.name == std::get<keyword>(b.data).name; }
        bool operator()(const symbol &v) const { return v.name == std::get<symbol>(b.data).name; }
        bool ordered(const std::vector<node_ptr> &le, const std::vector<node_ptr> &re) const
        {
            if (le.size() != re.size())
                return false;
            for (size_t i = 0; i < le.size(); ++i)
                if (!equal_impl(le[i], re[i]))
                    return false;
            return true;
        }
        bool operator()(const list &v) const { return ordered(v.elems, std::get<list>(b.data).elems); }
        bool operator()(const vector_t &v) const { return ordered(v.elems, std::get<vector_t>(b.data).elems); }
        bool operator()(const set &v) const { return equal_unordered(v.elems, std::get<set>(b.data).elems); }
        bool operator()(const map &v) const
        {
            const auto &rm = std::get<map>(b.data).entries;
            if (v.entries.size() != rm.size())
                return false;
            std::vector<bool> used(rm.size());
            for (const auto &kv : v.entries)
            {
                bool found = false;
                for (size_t j = 0; j < rm.size(); ++j)
                {
                    if (!used[j] && equal_impl(kv.first, rm[j].first) && equal_impl(kv.second, rm[j].second))
                    {
                        used[j] = true;
                        found = true;
                        break;
                    }
                }
                if (!found)
                    return false;
            }
            return true;
        }
    };
    return std::visit(Visitor{*b}, a->data);
}

bool equal_unordered(const std::vector<node_ptr> &le, const std::vector<node_ptr> &re)
{
    if (le.size() != re.size())
        return false;
    std::vector<bool> used(re.size());
    for (const auto &e : le)
    {
        bool found = false;
        for (size_t j = 0; j < re.size(); ++j)
        {
            if (!used[j] && equal_impl(e, re[j]))
            {
                used[j] = true;
                found = true;
                break;
            }
        }
        if (!found)
            return false;
    }
    return true;
}

} // namespace

bool equal(const node_ptr &a, const node_ptr &b) { return equal_impl(a, b); }

} // namespace graft::edn
