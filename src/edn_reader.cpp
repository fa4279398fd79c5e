// EDN reader: text -> node tree with line/column positions.
#include "graft/edn.hpp"
#include <cctype>

namespace graft::edn {

namespace {

struct reader
{
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get()
    {
        if (eof())
            return '\0';
        char c = d[p++];
        if (c == '\n')
        {
            ++line;
            col = 1;
        }
        else
            ++col;
        return c;
    }
    [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line, col); }
    void skip_ws()
    {
        while (!eof())
        {
            char c = peek();
            if (c == ';')
            {
                while (!eof() && get() != '\n')
                    continue;
                continue;
            }
            // commas are whitespace in EDN
            if (c == ',' || std::isspace((unsigned char)c))
            {
                get();
                continue;
            }
            break;
        }
    }
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_symbol_start(char c)
{
    return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' ||
           c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '.';
}
bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '#' || c == ':'; }

node_ptr positioned(node_data d, int line, int col)
{
    auto n = make(std::move(d));
    n->line = line;
    n->col = col;
    return n;
}

node_ptr parse_value(reader &r);

std::vector<node_ptr> parse_elems(reader &r, char end)
{
    std::vector<node_ptr> elems;
    r.skip_ws();
    while (!r.eof() && r.peek() != end)
    {
        elems.push_back(parse_value(r));
        r.skip_ws();
    }
    if (r.get() != end)
        r.fail(std::string("unterminated collection, expected '") + end + "'");
    return elems;
}

node_ptr parse_string(reader &r)
{
    int sl = r.line, sc = r.col;
    r.get(); // opening quote
    std::string out;
    for (;;)
    {
        if (r.eof())
            r.fail("unterminated string");
        char c = r.get();
        if (c == '"')
            break;
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (r.eof())
            r.fail("bad escape");
        char e = r.get();
        switch (e)
        {
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        default:
            out += e;
            break;
        }
    }
    return positioned(std::move(out), sl, sc);
}

node_ptr parse_number(reader &r)
{
    int sl = r.line, sc = r.col;
    std::string num;
    if (r.peek() == '+' || r.peek() == '-')
        num += r.get();
    bool is_float = false;
    while (is_digit(r.peek()))
        num += r.get();
    if (r.peek() == '.')
    {
        is_float = true;
        num += r.get();
        while (is_digit(r.peek()))
            num += r.get();
    }
    if (r.peek() == 'e' || r.peek() == 'E')
    {
        is_float = true;
        num += r.get();
        if (r.peek() == '+' || r.peek() == '-')
            num += r.get();
        while (is_digit(r.peek()))
            num += r.get();
    }
    try
    {
        if (is_float)
            return positioned(std::stod(num), sl, sc);
        return positioned(static_cast<int64_t>(std::stoll(num)), sl, sc);
    }
    catch (const std::logic_error &)
    {
        throw parse_error("invalid number '" + num + "'", sl, sc);
    }
}

node_ptr parse_symbol_or_keyword(reader &r)
{
    int sl = r.line, sc = r.col;
    bool kw = false;
    if (r.peek() == ':')
    {
        kw = true;
        r.get();
    }
    std::string s;
    while (is_symbol_char(r.peek()))
        s += r.get();
    if (s.empty())
        r.fail("empty symbol");
    if (kw)
        return positioned(keyword{s}, sl, sc);
    if (s == "nil")
        return positioned(std::monostate{}, sl, sc);
    if (s == "true")
        return positioned(true, sl, sc);
    if (s == "false")
        return positioned(false, sl, sc);
    return positioned(symbol{s}, sl, sc);
}

node_ptr parse_value(reader &r)
{
    r.skip_ws();
    int sl = r.line, sc = r.col;
    char c = r.peek();
    switch (c)
    {
    case '\0':
        r.fail("unexpected end of input");
    case '"':
        return parse_string(r);
    case '(':
        r.get();
        return positioned(list{parse_elems(r, ')')}, sl, sc);
    case '[':
        r.get();
        return positioned(vector_t{parse_elems(r, ']')}, sl, sc);
    case '{':
    {
        r.get();
        auto elems = parse_elems(r, '}');
        if (elems.size() % 2)
            throw parse_error("map requires even number of forms", sl, sc);
        map m;
        for (size_t i = 0; i < elems.size(); i += 2)
            m.entries.emplace_back(elems[i], elems[i + 1]);
        return positioned(std::move(m), sl, sc);
    }
    case '#':
        r.get();
        if (r.peek() != '{')
            r.fail("only #{...} sets are supported after '#'");
        r.get();
        return positioned(set{parse_elems(r, '}')}, sl, sc);
    default:
        break;
    }
    if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
        return parse_number(r);
    if (c == ':' || is_symbol_start(c))
        return parse_symbol_or_keyword(r);
    r.fail(std::string("unexpected character '") + c + "'");
}

} // namespace

node_ptr parse(std::string_view src)
{
    reader r(src);
    r.skip_ws();
    auto v = parse_value(r);
    r.skip_ws();
    if (!r.eof())
        r.fail("unexpected trailing characters");
    return v;
}

} // namespace graft::edn
