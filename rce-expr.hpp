#pragma once
#include <cctype>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "rce-core.hpp"




//=============================================================================
namespace rce
{


    //=========================================================================
    class node;
    class parser;
    class host_registry;


    //=========================================================================
    inline bool is_letter_code_point(std::uint32_t cp);
    inline std::size_t letter_width(const char* c);
    inline bool is_identifier(const std::string& id);
    inline bool is_reserved(const std::string& id);
    inline void check_identifier(const std::string& id);
}




//=============================================================================
/**
 * Return false for non-ASCII code points that are not letters: Latin-1
 * symbols, punctuation, arrows, mathematical and technical symbols, CJK and
 * fullwidth punctuation, surrogates and private use, and pictographs.
 */
bool rce::is_letter_code_point(std::uint32_t cp)
{
    struct range { std::uint32_t lo, hi; };

    static const range excluded[] = {
        {0x0080, 0x00a9}, {0x00ab, 0x00b4}, {0x00b6, 0x00b9}, {0x00bb, 0x00bf},
        {0x00d7, 0x00d7}, {0x00f7, 0x00f7},
        {0x2000, 0x2bff}, {0x2e00, 0x2e7f},
        {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030},
        {0xd800, 0xf8ff},
        {0xfe30, 0xfe6f},
        {0xff00, 0xff20}, {0xff3b, 0xff40}, {0xff5b, 0xff65},
        {0xfff0, 0xffff},
        {0x1f000, 0x1faff},
    };

    if (cp > 0x10ffff)
    {
        return false;
    }
    for (const auto& r : excluded)
    {
        if (r.lo <= cp && cp <= r.hi)
        {
            return false;
        }
    }
    return true;
}


/**
 * Return the length in bytes of the letter or underscore starting at c, or
 * zero if c does not start one. Letters outside ASCII are decoded from UTF-8
 * and may be from any script.
 */
std::size_t rce::letter_width(const char* c)
{
    auto b = static_cast<unsigned char>(c[0]);

    if (b < 0x80)
    {
        return std::isalpha(b) || b == '_' ? 1 : 0;
    }

    auto n = std::size_t(b >= 0xf8 ? 0 : b >= 0xf0 ? 4 : b >= 0xe0 ? 3 : b >= 0xc0 ? 2 : 0);
    auto cp = std::uint32_t(b & (0x7f >> n));

    if (n == 0)
    {
        return 0;
    }
    for (std::size_t i = 1; i < n; ++i)
    {
        auto x = static_cast<unsigned char>(c[i]);

        if ((x & 0xc0) != 0x80)
        {
            return 0;
        }
        cp = (cp << 6) | (x & 0x3f);
    }
    return is_letter_code_point(cp) ? n : 0;
}


/**
 * Return true if id is syntactically a cell identifier: a letter or
 * underscore followed by letters, digits, or underscores.
 */
bool rce::is_identifier(const std::string& id)
{
    auto c = id.c_str();
    auto n = letter_width(c);

    if (n == 0)
    {
        return false;
    }
    for (c += n; *c; c += n)
    {
        n = std::isdigit(static_cast<unsigned char>(*c)) ? 1 : letter_width(c);

        if (n == 0)
        {
            return false;
        }
    }
    return std::size_t(c - id.c_str()) == id.size();
}


/**
 * Return true if id is, case-insensitively, a keyword or the name of a
 * built-in function.
 */
bool rce::is_reserved(const std::string& id)
{
    return boost::algorithm::iequals(id, "true")
        || boost::algorithm::iequals(id, "false")
        || boost::algorithm::iequals(id, "extern")
        || core::find(id) != nullptr;
}


/**
 * Throw invalid_identifier, or its subclass reserved_name, unless id may name
 * a cell.
 */
void rce::check_identifier(const std::string& id)
{
    if (! is_identifier(id))
    {
        throw invalid_identifier("invalid identifier: '" + id + "'");
    }
    if (is_reserved(id))
    {
        throw reserved_name("reserved name: '" + id + "'");
    }
}




//=============================================================================
/**
 * A table of host functions, reachable from formulas through
 * extern(name, args...). Lookup is by exact name.
 */
class rce::host_registry
{
public:


    void define(const std::string& name, func_t func)
    {
        functions[name] = func;
    }


    /**
     * Call a registered function. Any failure, including a missing name, is
     * reported as an eval_error with the host_call code.
     */
    value call(const std::string& name, const args_t& args) const
    {
        auto f = functions.find(name);

        if (f == functions.end())
        {
            throw eval_error(error_code::host_call, "host call failure: no function named '" + name + "'");
        }

        auto result = value();

        try {
            result = f->second(args);
        }
        catch (const std::exception& e)
        {
            throw eval_error(error_code::host_call, "host call failure: " + name + ": " + e.what());
        }
        catch (...)
        {
            throw eval_error(error_code::host_call, "host call failure: " + name + " threw a non-standard exception");
        }

        if (result.is_none())
        {
            throw eval_error(error_code::host_call, "host call failure: " + name + " returned no value");
        }
        return result;
    }


private:
    std::map<std::string, func_t> functions;
};




//=============================================================================
/**
 * A node in a parsed formula. Children are held by value; a tree is
 * immutable once built and may be evaluated from several threads at once.
 * A binary node holds a run of operands joined by operators of the same
 * precedence level, applied left to right.
 */
class rce::node
{
public:


    //=========================================================================
    enum class kind { literal, reference, call, unary, binary };


    //=========================================================================
    static node literal(const rce::value& v)
    {
        auto n = node(kind::literal);
        n.literal_value = v;
        return n;
    }

    static node reference(const std::string& id)
    {
        auto n = node(kind::reference);
        n.name = id;
        return n;
    }

    static node call(const std::string& func, std::vector<node> args)
    {
        auto n = node(kind::call);
        n.name = func;
        n.children = std::move(args);
        return n;
    }

    static node unary(const std::string& op, node operand)
    {
        auto n = node(kind::unary);
        n.name = op;
        n.children.push_back(std::move(operand));
        return n;
    }

    static node binary(const std::string& op, node lhs, node rhs)
    {
        auto n = node(kind::binary);
        n.ops = {op};
        n.children.push_back(std::move(lhs));
        n.children.push_back(std::move(rhs));
        return n;
    }

    /**
     * Operands o0 .. on joined by ops[0] .. ops[n-1], left-associative.
     */
    static node chain(std::vector<std::string> ops, std::vector<node> operands)
    {
        auto n = node(kind::binary);
        n.ops = std::move(ops);
        n.children = std::move(operands);
        return n;
    }


    /**
     * Evaluate this tree. The lookup is a callable taking a cell id and
     * returning its value; it throws eval_error for ids that cannot be
     * resolved. Operands of && and ||, and the untaken branches of if and
     * ifs, are not evaluated.
     */
    template<typename Lookup>
    rce::value evaluate(const Lookup& lookup, const host_registry& host) const
    {
        switch (k)
        {
            case kind::literal: return literal_value;
            case kind::reference: return lookup(name);
            case kind::unary:
            {
                auto x = children[0].evaluate(lookup, host).as_number();
                return name == "-" ? decimal(-x) : x;
            }
            case kind::binary: return evaluate_binary(lookup, host);
            case kind::call: return evaluate_call(lookup, host);
        }
        return rce::value();
    }


    /**
     * Return a formula string (without the leading =) that parses back to
     * this tree.
     */
    std::string unparse() const
    {
        switch (k)
        {
            case kind::literal:
            {
                if (literal_value.has_type(value_type::text))
                {
                    auto q = literal_value.get_text().find('\'') == std::string::npos ? "'" : "\"";
                    return q + literal_value.get_text() + q;
                }
                return literal_value.as_str();
            }
            case kind::reference: return name;
            case kind::unary: return name + children[0].unparse();
            case kind::binary:
            {
                auto s = children[0].unparse();

                for (std::size_t n = 1; n < children.size(); ++n)
                {
                    s = "(" + s + " " + ops[n - 1] + " " + children[n].unparse() + ")";
                }
                return s;
            }
            case kind::call:
            {
                auto args = std::vector<std::string>();

                for (const auto& child : children)
                {
                    args.push_back(child.unparse());
                }
                return name + "(" + boost::algorithm::join(args, ", ") + ")";
            }
        }
        return std::string();
    }


private:


    //=========================================================================
    node(kind k) : k(k) {}

    template<typename Lookup>
    rce::value evaluate_binary(const Lookup& lookup, const host_registry& host) const
    {
        auto a = children[0].evaluate(lookup, host);

        for (std::size_t n = 1; n < children.size(); ++n)
        {
            const auto& op = ops[n - 1];

            if (op == "&&")
            {
                a = a.as_boolean() && children[n].evaluate(lookup, host).as_boolean();
            }
            else if (op == "||")
            {
                a = a.as_boolean() || children[n].evaluate(lookup, host).as_boolean();
            }
            else
            {
                a = apply(op, a, children[n].evaluate(lookup, host));
            }
        }
        return a;
    }

    static rce::value apply(const std::string& op, const rce::value& a, const rce::value& b)
    {
        if (op == "==") return a.compare(b) == 0;
        if (op == "!=") return a.compare(b) != 0;
        if (op == "<")  return a.compare(b) <  0;
        if (op == "<=") return a.compare(b) <= 0;
        if (op == ">")  return a.compare(b) >  0;
        if (op == ">=") return a.compare(b) >= 0;

        auto x = a.as_number();
        auto y = b.as_number();

        switch (op[0])
        {
            case '+': return core::add(x, y);
            case '-': return core::subtract(x, y);
            case '*': return core::multiply(x, y);
            case '/': return core::divide(x, y);
            case '\\': return core::floordiv(x, y);
            case '%': return core::modulo(x, y);
            case '^': return core::power(x, y);
        }
        throw eval_error(error_code::parse, "unknown operator " + op);
    }

    template<typename Lookup>
    rce::value evaluate_call(const Lookup& lookup, const host_registry& host) const
    {
        if (boost::algorithm::iequals(name, "extern"))
        {
            if (children.empty())
            {
                throw eval_error(error_code::arity_mismatch, "arity mismatch: extern expects at least 1 argument(s), got 0");
            }
            auto func = children[0].evaluate(lookup, host);

            if (! func.has_type(value_type::text))
            {
                throw eval_error(error_code::host_call, "host call failure: extern expects a function name, got " + std::string(func.type_name()));
            }
            return host.call(func.get_text(), evaluate_all(lookup, host, 1));
        }

        auto f = core::find(name);

        if (f == nullptr)
        {
            throw eval_error(error_code::unknown_function, "unknown function: " + name);
        }
        core::check_arity(*f, children.size());

        if (f->name == "if")
        {
            auto n = children[0].evaluate(lookup, host).as_boolean() ? 1 : 2;
            return children[n].evaluate(lookup, host);
        }
        if (f->name == "ifs")
        {
            std::size_t n = 0;

            for (; n + 1 < children.size(); n += 2)
            {
                if (children[n].evaluate(lookup, host).as_boolean())
                {
                    return children[n + 1].evaluate(lookup, host);
                }
            }
            if (n < children.size())
            {
                return children[n].evaluate(lookup, host);
            }
            throw eval_error(error_code::domain, "domain error: ifs matched no condition and has no default");
        }
        return f->func(evaluate_all(lookup, host, 0));
    }

    template<typename Lookup>
    args_t evaluate_all(const Lookup& lookup, const host_registry& host, std::size_t start) const
    {
        auto args = args_t();

        for (std::size_t n = start; n < children.size(); ++n)
        {
            args.push_back(children[n].evaluate(lookup, host));
        }
        return args;
    }


    //=========================================================================
    kind k;
    std::string name;
    std::vector<std::string> ops;
    rce::value literal_value;
    std::vector<node> children;
};




//=============================================================================
/**
 * Tokenizer and recursive-descent parser for formulas. Precedence, from
 * lowest to highest:
 *
 *     ||    &&    == != < <= > >=    + -    * / \ %    ^    unary + -
 *
 * All binary operators are left-associative except ^.
 */
class rce::parser
{
public:


    //=========================================================================
    /** Deepest nesting of parentheses, calls, unary signs and ^ accepted. */
    static constexpr int max_nesting = 256;


    //=========================================================================
    enum class token_type { number, text, identifier, op, comma, lparen, rparen, end };

    struct token_t
    {
        token_type type;
        std::string str;
        rce::value literal;
    };


    //=========================================================================
    /**
     * Parse a formula (the part after the leading =) into a tree. Throws
     * eval_error with code parse on any syntax error.
     */
    static node parse(const std::string& source)
    {
        auto tokens = tokenize(source.data(), false);
        const token_t* t = tokens.data();

        if (t->type == token_type::end)
        {
            throw eval_error(error_code::parse, "parse error: empty formula");
        }

        auto tree = parse_or(t, 0);

        if (t->type != token_type::end)
        {
            throw eval_error(error_code::parse, "parse error: unexpected '" + t->str + "'");
        }
        return tree;
    }


    /**
     * Return the identifiers in a formula that could name cells. This is a
     * syntactic scan: it does not care whether the formula parses, and stops
     * quietly at the first character it cannot tokenize.
     */
    static std::set<std::string> symbols(const std::string& source)
    {
        auto result = std::set<std::string>();

        for (const auto& t : tokenize(source.data(), true))
        {
            if (t.type == token_type::identifier && is_identifier(t.str) && ! is_reserved(t.str))
            {
                result.insert(t.str);
            }
        }
        return result;
    }


    /**
     * Split source into tokens, terminated by an end token. A lenient
     * tokenizer stops at the first error; otherwise the error is thrown.
     */
    static std::vector<token_t> tokenize(const char* c, bool lenient)
    {
        auto tokens = std::vector<token_t>();
        auto tok = token_t();

        while (true)
        {
            auto error = next_token(c, tok);

            if (! error.empty())
            {
                if (! lenient)
                {
                    throw eval_error(error_code::parse, "parse error: " + error);
                }
                tokens.push_back({token_type::end, "", rce::value()});
                return tokens;
            }
            tokens.push_back(tok);

            if (tok.type == token_type::end)
            {
                return tokens;
            }
        }
    }


private:


    //=========================================================================
    static bool is_digit(char c)
    {
        return std::isdigit(static_cast<unsigned char>(c));
    }


    /**
     * Read one token starting at c, advancing c past it. Returns an error
     * message, or an empty string on success.
     */
    static std::string next_token(const char*& c, token_t& tok)
    {
        while (std::isspace(static_cast<unsigned char>(*c)))
        {
            ++c;
        }

        auto start = c;
        tok.literal = rce::value();

        if (*c == '\0')
        {
            tok.type = token_type::end;
            tok.str.clear();
            return std::string();
        }
        if (is_digit(*c) || (*c == '.' && is_digit(c[1])))
        {
            auto d = decimal();

            while (is_digit(*c)) ++c;

            if (*c == '.')
            {
                ++c;
                while (is_digit(*c)) ++c;
            }
            if ((*c == 'e' || *c == 'E') && (is_digit(c[1]) || ((c[1] == '+' || c[1] == '-') && is_digit(c[2]))))
            {
                c += 2;
                while (is_digit(*c)) ++c;
            }
            tok.type = token_type::number;
            tok.str = std::string(start, c);

            if (! parse_decimal(tok.str, d))
            {
                return "bad numeric literal " + tok.str;
            }
            tok.literal = d;
            return std::string();
        }
        if (auto n = letter_width(c))
        {
            do
            {
                c += n;
                n = is_digit(*c) ? 1 : letter_width(c);
            } while (n);

            tok.type = token_type::identifier;
            tok.str = std::string(start, c);
            return std::string();
        }
        if (*c == '\'' || *c == '"')
        {
            auto quote = *c++;

            while (*c != quote)
            {
                if (*c == '\0')
                {
                    c = start;
                    return "unterminated string literal";
                }
                ++c;
            }
            tok.type = token_type::text;
            tok.str = std::string(start, ++c);
            tok.literal = std::string(start + 1, c - 1);
            return std::string();
        }

        auto two = std::string(c, c[1] == '\0' ? 1 : 2);

        if (two == "==" || two == "!=" || two == "<=" || two == ">=" || two == "&&" || two == "||")
        {
            c += 2;
            tok.type = token_type::op;
            tok.str = two;
            return std::string();
        }

        switch (*c)
        {
            case '+': case '-': case '*': case '/': case '\\': case '%': case '^': case '<': case '>':
                tok.type = token_type::op;
                break;
            case ',': tok.type = token_type::comma; break;
            case '(': tok.type = token_type::lparen; break;
            case ')': tok.type = token_type::rparen; break;
            default: return std::string("unexpected character '") + *c + "'";
        }
        tok.str = std::string(c, 1);
        ++c;
        return std::string();
    }


    //=========================================================================
    static bool accept_op(const token_t*& t, const char* op)
    {
        if (t->type == token_type::op && t->str == op)
        {
            ++t;
            return true;
        }
        return false;
    }

    static void expect(const token_t*& t, token_type type, const char* what)
    {
        if (t->type != type)
        {
            auto found = t->type == token_type::end ? std::string("end of formula") : "'" + t->str + "'";
            throw eval_error(error_code::parse, std::string("parse error: expected ") + what + ", found " + found);
        }
        ++t;
    }

    /**
     * Parse one precedence level: operands from next, joined by operators
     * accepted by match, into a single left-associative chain.
     */
    template<typename Next, typename Match>
    static node parse_chain(const token_t*& t, int depth, Next next, Match match)
    {
        auto operands = std::vector<node>();
        auto ops = std::vector<std::string>();

        operands.push_back(next(t, depth));

        while (t->type == token_type::op && match(t->str))
        {
            ops.push_back((t++)->str);
            operands.push_back(next(t, depth));
        }
        if (ops.empty())
        {
            return std::move(operands[0]);
        }
        return node::chain(std::move(ops), std::move(operands));
    }

    static node parse_or(const token_t*& t, int depth)
    {
        return parse_chain(t, depth, parse_and, [] (const std::string& op)
        {
            return op == "||";
        });
    }

    static node parse_and(const token_t*& t, int depth)
    {
        return parse_chain(t, depth, parse_comparison, [] (const std::string& op)
        {
            return op == "&&";
        });
    }

    static node parse_comparison(const token_t*& t, int depth)
    {
        return parse_chain(t, depth, parse_additive, [] (const std::string& op)
        {
            return op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=";
        });
    }

    static node parse_additive(const token_t*& t, int depth)
    {
        return parse_chain(t, depth, parse_multiplicative, [] (const std::string& op)
        {
            return op == "+" || op == "-";
        });
    }

    static node parse_multiplicative(const token_t*& t, int depth)
    {
        return parse_chain(t, depth, parse_power, [] (const std::string& op)
        {
            return op == "*" || op == "/" || op == "\\" || op == "%";
        });
    }

    static node parse_power(const token_t*& t, int depth)
    {
        auto base = parse_unary(t, depth);

        if (accept_op(t, "^"))
        {
            return node::binary("^", std::move(base), parse_power(t, descend(depth)));
        }
        return base;
    }

    static node parse_unary(const token_t*& t, int depth)
    {
        if (t->type == token_type::op && (t->str == "+" || t->str == "-"))
        {
            auto op = (t++)->str;
            return node::unary(op, parse_unary(t, descend(depth)));
        }
        return parse_primary(t, depth);
    }

    static node parse_primary(const token_t*& t, int depth)
    {
        switch (t->type)
        {
            case token_type::number:
            case token_type::text:
                return node::literal((t++)->literal);

            case token_type::lparen:
            {
                ++t;
                auto inner = parse_or(t, descend(depth));
                expect(t, token_type::rparen, "')'");
                return inner;
            }
            case token_type::identifier:
            {
                auto id = (t++)->str;

                if (t->type == token_type::lparen)
                {
                    return node::call(id, parse_arguments(t, descend(depth)));
                }
                if (boost::algorithm::iequals(id, "true"))
                {
                    return node::literal(true);
                }
                if (boost::algorithm::iequals(id, "false"))
                {
                    return node::literal(false);
                }
                if (is_reserved(id))
                {
                    throw eval_error(error_code::parse, "parse error: reserved name '" + id + "' used as a reference");
                }
                return node::reference(id);
            }
            case token_type::end:
                throw eval_error(error_code::parse, "parse error: unexpected end of formula");

            default:
                throw eval_error(error_code::parse, "parse error: unexpected '" + t->str + "'");
        }
    }

    static std::vector<node> parse_arguments(const token_t*& t, int depth)
    {
        auto args = std::vector<node>();
        expect(t, token_type::lparen, "'('");

        if (t->type == token_type::rparen)
        {
            ++t;
            return args;
        }

        args.push_back(parse_or(t, depth));

        while (t->type == token_type::comma)
        {
            ++t;
            args.push_back(parse_or(t, depth));
        }
        expect(t, token_type::rparen, "',' or ')'");
        return args;
    }

    static int descend(int depth)
    {
        if (depth >= max_nesting)
        {
            throw eval_error(error_code::parse, "parse error: formula nested more than " + std::to_string(max_nesting) + " levels deep");
        }
        return depth + 1;
    }
};




//=============================================================================
#ifdef TEST_EXPR
#include <catch2/catch.hpp>
using namespace rce;




//=============================================================================
namespace {

    struct test_lookup
    {
        value operator()(const std::string& id) const
        {
            auto v = cells.find(id);

            if (v == cells.end())
            {
                throw eval_error(error_code::unresolved_reference, "unresolved reference: " + id);
            }
            return v->second;
        }
        std::map<std::string, value> cells;
    };

    std::string eval(const std::string& formula, const test_lookup& lookup = test_lookup(), const host_registry& host = host_registry())
    {
        return parser::parse(formula).evaluate(lookup, host).as_str();
    }

    error_code eval_code(const std::string& formula, const test_lookup& lookup = test_lookup())
    {
        try {
            eval(formula, lookup);
        }
        catch (const eval_error& e)
        {
            return e.get_code();
        }
        FAIL("expected an eval_error from " << formula);
        return error_code::parse;
    }
}




//=============================================================================
TEST_CASE("identifiers are validated", "[identifier]")
{
    REQUIRE(is_identifier("A1"));
    REQUIRE(is_identifier("_tmp"));
    REQUIRE(is_identifier("单元格"));
    REQUIRE_FALSE(is_identifier(""));
    REQUIRE_FALSE(is_identifier("1A"));
    REQUIRE_FALSE(is_identifier("A-1"));
    REQUIRE_FALSE(is_identifier("A 1"));
    REQUIRE(is_identifier("Été_2"));
    REQUIRE(is_identifier("Ωmega"));
    REQUIRE(is_identifier("数据_1"));
    REQUIRE_FALSE(is_identifier("A，B"));
    REQUIRE_FALSE(is_identifier("A→B"));
    REQUIRE_FALSE(is_identifier("→"));
    REQUIRE_FALSE(is_identifier("总计。"));
    REQUIRE_FALSE(is_identifier(std::string("A\0B", 3)));
    REQUIRE(is_reserved("SQRT"));
    REQUIRE(is_reserved("True"));
    REQUIRE(is_reserved("extern"));
    REQUIRE(is_reserved("ifs"));
    REQUIRE_FALSE(is_reserved("A1"));
    REQUIRE_THROWS_AS(check_identifier("1A"), invalid_identifier);
    REQUIRE_THROWS_AS(check_identifier("max"), reserved_name);
    REQUIRE_NOTHROW(check_identifier("total"));
}




TEST_CASE("tokenizer splits formulas", "[parser]")
{
    auto tokens = parser::tokenize("A1+ 2.5*'x,y' >= sqrt(B_2)", false);
    REQUIRE(tokens.size() == 11);
    REQUIRE(tokens[0].type == parser::token_type::identifier);
    REQUIRE(tokens[1].str == "+");
    REQUIRE(tokens[2].literal == value(decimal("2.5")));
    REQUIRE(tokens[4].literal == value("x,y"));
    REQUIRE(tokens[5].str == ">=");
    REQUIRE(tokens[10].type == parser::token_type::end);
    REQUIRE_THROWS_AS(parser::tokenize("A1 = 2", false), eval_error);
    REQUIRE_THROWS_AS(parser::tokenize("'open", false), eval_error);
}




TEST_CASE("parser respects precedence and associativity", "[parser]")
{
    REQUIRE(parser::parse("1 + 2 * 3").unparse() == "(1 + (2 * 3))");
    REQUIRE(parser::parse("2 ^ 3 ^ 2").unparse() == "(2 ^ (3 ^ 2))");
    REQUIRE(parser::parse("8 - 3 - 2").unparse() == "((8 - 3) - 2)");
    REQUIRE(parser::parse("-A ^ 2").unparse() == "(-A ^ 2)");
    REQUIRE(parser::parse("a || b && c").unparse() == "(a || (b && c))");
    REQUIRE(parser::parse("1 < 2 == TRUE").unparse() == "((1 < 2) == TRUE)");
    REQUIRE(parser::parse("max(1, 'a', x)").unparse() == "max(1, 'a', x)");
    REQUIRE(eval("2 ^ 3 ^ 2") == "512");
    REQUIRE(eval("(1 + 2) * 3") == "9");
    REQUIRE(eval("10 - 2 - 3 + 1") == "6");
    REQUIRE(eval("100 / 10 / 5 * 3") == "6");
    REQUIRE(eval("FALSE && 1 / 0 && 1 / 0") == "FALSE");
    REQUIRE(eval("FALSE || FALSE || 1") == "TRUE");
}




TEST_CASE("parser rejects malformed formulas", "[parser]")
{
    REQUIRE_THROWS_AS(parser::parse(""), eval_error);
    REQUIRE_THROWS_AS(parser::parse("1 +"), eval_error);
    REQUIRE_THROWS_AS(parser::parse("(1 + 2"), eval_error);
    REQUIRE_THROWS_AS(parser::parse("1 2"), eval_error);
    REQUIRE_THROWS_AS(parser::parse("sqrt(1,)"), eval_error);
    REQUIRE_THROWS_AS(parser::parse("sqrt + 1"), eval_error);
    REQUIRE_THROWS_AS(parser::parse("A1，B1"), eval_error);
}




TEST_CASE("parser handles long and deeply nested formulas", "[parser]")
{
    auto sum = std::string("1");

    for (int n = 1; n < 20000; ++n)
    {
        sum += "+1";
    }
    REQUIRE(eval(sum) == "20000");
    REQUIRE(eval("(" + sum + ")-(" + sum + ")") == "0");

    auto lookup = test_lookup();
    lookup.cells["A"] = value(true);
    auto conjunction = std::string("A");

    for (int n = 1; n < 5000; ++n)
    {
        conjunction += "&&A";
    }
    REQUIRE(eval(conjunction, lookup) == "TRUE");

    auto nested = [] (int depth)
    {
        return std::string(depth, '(') + "2" + std::string(depth, ')');
    };
    REQUIRE(eval(nested(parser::max_nesting)) == "2");
    REQUIRE(eval_code(nested(parser::max_nesting + 1)) == error_code::parse);
    REQUIRE(eval_code(nested(5000)) == error_code::parse);
    REQUIRE(eval_code(std::string(5000, '-') + "1") == error_code::parse);
    REQUIRE(eval(std::string(100, '-') + "1") == "1");
}




TEST_CASE("symbols are extracted syntactically", "[parser]")
{
    REQUIRE(parser::symbols("A1 + B1 * sqrt(C1)") == std::set<std::string>{"A1", "B1", "C1"});
    REQUIRE(parser::symbols("IF(x > 0, 'y', TRUE)") == std::set<std::string>{"x"});
    REQUIRE(parser::symbols("A1 + A1") == std::set<std::string>{"A1"});
    REQUIRE(parser::symbols("A1 + 'B1' + (C1") == std::set<std::string>{"A1", "C1"});
    REQUIRE(parser::symbols("A1 + ? + B1") == std::set<std::string>{"A1"});
    REQUIRE(parser::symbols("A1→B1") == std::set<std::string>{"A1"});
    REQUIRE(parser::symbols("价格 * 数量") == std::set<std::string>{"价格", "数量"});
}




TEST_CASE("arithmetic is decimal", "[evaluate]")
{
    auto lookup = test_lookup();
    lookup.cells["A1"] = value(100);
    lookup.cells["B1"] = value(decimal("200.5"));

    REQUIRE(eval("0.1 + 0.2") == "0.3");
    REQUIRE(eval("A1 + B1", lookup) == "300.5");
    REQUIRE(eval("A1 * B1", lookup) == "20050");
    REQUIRE(eval("B1 / A1", lookup) == "2.005");
    REQUIRE(eval("A1 ^ 2", lookup) == "10000");
    REQUIRE(eval("B1 \\ A1", lookup) == "2");
    REQUIRE(eval("-7 \\ 2") == "-4");
    REQUIRE(eval("7 % 3") == "1");
    REQUIRE(eval("-7 % 3") == "2");
    REQUIRE(eval("7 % -3") == "1");
    REQUIRE(eval("1 / 3") == "0." + std::string(34, '3'));
    REQUIRE(eval("'2' * 3") == "6");
    REQUIRE(eval("TRUE + 1") == "2");
    REQUIRE(eval("--2") == "2");
}




TEST_CASE("comparison and logic", "[evaluate]")
{
    REQUIRE(eval("1 < 2") == "TRUE");
    REQUIRE(eval("2 <= 1") == "FALSE");
    REQUIRE(eval("'b' > 'a'") == "TRUE");
    REQUIRE(eval("1.0 == 1") == "TRUE");
    REQUIRE(eval("10 == '10'") == "TRUE");
    REQUIRE(eval("1 != 2 && 2 > 1") == "TRUE");
    REQUIRE(eval("FALSE || 0") == "FALSE");
    REQUIRE(eval("FALSE && 1 / 0") == "FALSE");
    REQUIRE(eval("TRUE || missing") == "TRUE");
}




TEST_CASE("built-in functions", "[evaluate]")
{
    auto lookup = test_lookup();
    lookup.cells["B1"] = value(decimal("200.5"));
    lookup.cells["C1"] = value(85);

    REQUIRE(eval("ABS(-50)") == "50");
    REQUIRE(eval("SQRT(100)") == "10");
    REQUIRE(eval("ROUND(B1, 1)", lookup) == "200.5");
    REQUIRE(eval("round(2.5)") == "3");
    REQUIRE(eval("round(-2.5)") == "-3");
    REQUIRE(eval("round(1234.5, -2)") == "1200");
    REQUIRE(eval("round(1.005, 2)") == "1.01");
    REQUIRE(eval("ceil(1.2)") == "2");
    REQUIRE(eval("floor(-1.2)") == "-2");
    REQUIRE(eval("pow(2, 10)") == "1024");
    REQUIRE(eval("min(3, 1, 2)") == "1");
    REQUIRE(eval("max(3, 1, 2)") == "3");
    REQUIRE(eval("avg(1, 2, 3, 4)") == "2.5");
    REQUIRE(eval("round(log10(1000), 10)") == "3");
    REQUIRE(eval("round(exp(1), 5)") == "2.71828");
    REQUIRE(eval("sin(0)") == "0");
    REQUIRE(eval("NOT(TRUE)") == "FALSE");
    REQUIRE(eval("AND(TRUE, 1, 'x')") == "TRUE");
    REQUIRE(eval("OR(FALSE, 0)") == "FALSE");
    REQUIRE(eval("XOR(TRUE, FALSE, TRUE)") == "FALSE");
    REQUIRE(eval("XOR(TRUE, TRUE, TRUE)") == "TRUE");
    REQUIRE(eval("IF(C1 > 60, '大,big', '小')", lookup) == "大,big");
    REQUIRE(eval("IFS(C1 >= 90, '优', C1 >= 80, '良', '差')", lookup) == "良");
    REQUIRE(eval("IFS(C1 >= 90, '优', C1 >= 88, '良', C1 >= 86, '中', '差')", lookup) == "差");
}




TEST_CASE("conditionals evaluate only the selected branch", "[evaluate]")
{
    auto lookup = test_lookup();
    lookup.cells["A"] = value(0);

    REQUIRE(eval("if(A > 0, 1 / A, 0)", lookup) == "0");
    REQUIRE(eval("ifs(A == 0, 'zero', 1 / A > 1, 'big')", lookup) == "zero");
    REQUIRE(eval_code("ifs(A > 0, 'pos')", lookup) == error_code::domain);
}




TEST_CASE("evaluation errors carry their codes", "[evaluate]")
{
    REQUIRE(eval_code("1 / 0") == error_code::division_by_zero);
    REQUIRE(eval_code("1 \\ 0") == error_code::division_by_zero);
    REQUIRE(eval_code("1 % 0") == error_code::division_by_zero);
    REQUIRE(eval_code("sqrt(-1)") == error_code::domain);
    REQUIRE(eval_code("log(0)") == error_code::domain);
    REQUIRE(eval_code("asin(2)") == error_code::domain);
    REQUIRE(eval_code("10 ^ 400") == error_code::domain);
    REQUIRE(eval_code("nofunc(1)") == error_code::unknown_function);
    REQUIRE(eval_code("sqrt(1, 2)") == error_code::arity_mismatch);
    REQUIRE(eval_code("if(TRUE, 1)") == error_code::arity_mismatch);
    REQUIRE(eval_code("missing + 1") == error_code::unresolved_reference);
    REQUIRE(eval_code("'abc' + 1") == error_code::type_mismatch);
    REQUIRE(eval_code("1 +") == error_code::parse);
}




TEST_CASE("extern calls reach the host registry", "[evaluate]")
{
    auto host = host_registry();
    host.define("concat", [] (const args_t& args)
    {
        auto s = std::string();

        for (const auto& a : args)
            s += a.as_str();
        return value(s);
    });
    host.define("fail", [] (const args_t&) -> value
    {
        throw std::runtime_error("boom");
    });

    REQUIRE(eval("extern('concat', 'a', 1, TRUE)", test_lookup(), host) == "a1TRUE");

    try {
        eval("extern('fail')", test_lookup(), host);
        FAIL("expected a host call failure");
    }
    catch (const eval_error& e)
    {
        REQUIRE(e.get_code() == error_code::host_call);
        REQUIRE(std::string(e.what()).find("boom") != std::string::npos);
    }
    host.define("raw", [] (const args_t&) -> value
    {
        throw 42;
    });

    try {
        eval("extern('raw')", test_lookup(), host);
        FAIL("expected a host call failure");
    }
    catch (const eval_error& e)
    {
        REQUIRE(e.get_code() == error_code::host_call);
    }
    REQUIRE_THROWS_AS(eval("extern('nothing')", test_lookup(), host), eval_error);
    REQUIRE_THROWS_AS(eval("extern(1)", test_lookup(), host), eval_error);
}



#endif // TEST_EXPR
