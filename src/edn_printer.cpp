// EDN printers: compact single-line form and indented multi-line form.
#include "graft/edn.hpp"
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <limits>
#include <sstream>

namespace graft::edn {

namespace {

std::string escape_string(const std::string &s)
{
    std::string out = "\"";
    for (char c : s)
    {
        switch (c)
        {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string atom_to_string(const node &n)
{
    struct V
    {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        // Shortest form that reads back to the same double, always marked as a float.
        std::string operator()(double d) const
        {
            std::string out;
            for (int prec = std::numeric_limits<double>::digits10; prec <= std::numeric_limits<double>::max_digits10; ++prec)
            {
                std::ostringstream oss;
                oss << std::setprecision(prec) << d;
                out = oss.str();
                if (std::strtod(out.c_str(), nullptr) == d)
                    break;
            }
            if (out.find_first_of(".eEni") == std::string::npos)
                out += ".0";
            return out;
        }
        std::string operator()(const std::string &s) const { return escape_string(s); }
        std::string operator()(const keyword &k) const { return ':' + k.name; }
        std::string operator()(const symbol &s) const { return s.name; }
        std::string operator()(const list &) const { return {}; }
        std::string operator()(const vector_t &) const { return {}; }
        std::string operator()(const set &) const { return {}; }
        std::string operator()(const map &) const { return {}; }
    };
    return std::visit(V{}, n.data);
}

std::string join(const std::vector<node_ptr> &elems, const char *open, char close)
{
    std::string out = open;
    bool first = true;
    for (auto &e : elems)
    {
        if (!first)
            out += ' ';
        first = false;
        out += to_string(e);
    }
    out += close;
    return out;
}

} // namespace

std::string to_string(const node_ptr &n)
{
    if (!n)
        return "nil";
    if (auto *l = as_list(*n))
        return join(l->elems, "(", ')');
    if (auto *v = as_vector(*n))
        return join(v->elems, "[", ']');
    if (auto *s = as_set(*n))
        return join(s->elems, "#{", '}');
    if (auto *m = as_map(*n))
    {
        std::string out = "{";
        bool first = true;
        for (auto &kv : m->entries)
        {
            if (!first)
                out += ' ';
            first = false;
            out += to_string(kv.first) + ' ' + to_string(kv.second);
        }
        return out + '}';
    }
    return atom_to_string(*n);
}

std::string to_pretty_string(const node_ptr &root, int indentWidth)
{
    // Short collections of atoms stay on one line; a list keeps its head and the keyword/value
    // pairs that are atoms on the first line and breaks before every nested collection.
    const size_t MAX_INLINE_LEN = 90;
    auto pad = [](int spaces) { return std::string(static_cast<size_t>(spaces < 0 ? 0 : spaces), ' '); };
    auto all_atoms = [](const std::vector<node_ptr> &elems) {
        for (auto &e : elems)
            if (!is_atom(*e))
                return false;
        return true;
    };

    std::function<std::string(const node_ptr &, int)> pp = [&](const node_ptr &x, int indent) -> std::string {
        if (!x || is_atom(*x))
            return to_string(x);
        auto seq = [&](const std::vector<node_ptr> &elems, const char *open, char close) -> std::string {
            if (elems.empty())
                return std::string(open) + close;
            if (all_atoms(elems))
            {
                auto inl = to_string(x);
                if (inl.size() <= MAX_INLINE_LEN)
                    return inl;
            }
            std::string out = std::string(open) + "\n";
            for (size_t i = 0; i < elems.size(); ++i)
            {
                out += pad(indent + indentWidth) + pp(elems[i], indent + indentWidth);
                if (i + 1 < elems.size())
                    out += '\n';
            }
            return out + '\n' + pad(indent) + close;
        };
        if (auto *l = as_list(*x))
        {
            const auto &elems = l->elems;
            if (elems.empty())
                return "()";
            auto inl = to_string(x);
            if (all_atoms(elems) && inl.size() <= MAX_INLINE_LEN)
                return inl;
            std::string out = "(" + pp(elems[0], indent);
            size_t i = 1;
            // inline prefix of atomic keyword/value pairs
            while (i + 1 < elems.size() && is_atom(*elems[i]) && is_atom(*elems[i + 1]))
            {
                out += ' ' + to_string(elems[i]) + ' ' + to_string(elems[i + 1]);
                i += 2;
            }
            for (; i < elems.size(); ++i)
            {
                out += '\n' + pad(indent + indentWidth) + pp(elems[i], indent + indentWidth);
                // keep a keyword on the same line as the value that follows it
                if (as_keyword(*elems[i]) && i + 1 < elems.size())
                {
                    ++i;
                    out += ' ' + pp(elems[i], indent + indentWidth);
                }
            }
            return out + ')';
        }
        if (auto *v = as_vector(*x))
            return seq(v->elems, "[", ']');
        if (auto *s = as_set(*x))
            return seq(s->elems, "#{", '}');
        if (auto *m = as_map(*x))
        {
            if (m->entries.empty())
                return "{}";
            std::string out = "{\n";
            for (size_t i = 0; i < m->entries.size(); ++i)
            {
                out += pad(indent + indentWidth) + pp(m->entries[i].first, indent + indentWidth) + ' ' +
                       pp(m->entries[i].second, indent + indentWidth);
                if (i + 1 < m->entries.size())
                    out += '\n';
            }
            return out + '\n' + pad(indent) + '}';
        }
        return std::string("<unknown>");
    };
    return pp(root, 0);
}

} // namespace graft::edn
