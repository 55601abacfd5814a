#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "rce-decimal.hpp"




//=============================================================================
namespace rce
{


    //=========================================================================
    class value;
    enum class value_type { none, empty, number, text, boolean };
    enum class error_code
    {
        parse,
        type_mismatch,
        division_by_zero,
        domain,
        unknown_function,
        arity_mismatch,
        unresolved_reference,
        host_call,
    };


    //=========================================================================
    /**
     * Raised while evaluating a formula. These never escape a set or a
     * recompute: the engine stores the message as the cell's error.
     */
    class eval_error : public std::runtime_error
    {
    public:
        eval_error(error_code code, const std::string& what) : std::runtime_error(what), code(code) {}
        error_code get_code() const { return code; }
    private:
        error_code code;
    };


    class invalid_identifier : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };


    class reserved_name : public invalid_identifier
    {
    public:
        using invalid_identifier::invalid_identifier;
    };


    class circular_reference : public std::invalid_argument
    {
    public:
        circular_reference(const std::vector<std::string>& path)
        : std::invalid_argument("circular reference: " + boost::algorithm::join(path, " -> "))
        , path(path)
        {
        }
        const std::vector<std::string>& get_path() const { return path; }
    private:
        std::vector<std::string> path;
    };


    class malformed_line : public std::runtime_error
    {
    public:
        malformed_line(std::size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what)
        , line(line)
        {
        }
        std::size_t get_line() const { return line; }
    private:
        std::size_t line;
    };
}




//=============================================================================
class rce::value
{
public:


    /**
     * Return a value of type empty. This is the value of a cell with no
     * definition, as opposed to a default-constructed value, which means no
     * value has been computed at all.
     */
    static value empty()
    {
        auto v = value();
        v.type = value_type::empty;
        return v;
    }


    /**
     * Interpret a non-formula cell definition. Surrounding whitespace is
     * ignored. A quoted string ('..' or "..") is text without its quotes,
     * true and false (in any case) are booleans, a decimal literal is a
     * number, and anything else is taken as text.
     */
    static value parse_literal(const std::string& source)
    {
        auto s = boost::algorithm::trim_copy(source);
        auto d = decimal();

        if (s.empty())
        {
            return empty();
        }
        if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front())
        {
            return s.substr(1, s.size() - 2);
        }
        if (boost::algorithm::iequals(s, "true"))
        {
            return true;
        }
        if (boost::algorithm::iequals(s, "false"))
        {
            return false;
        }
        if (parse_decimal(s, d))
        {
            return d;
        }
        return s;
    }


    /**
     * Default constructor: no value.
     */
    value()                             : type(value_type::none) {}
    value(const decimal& valnum)        : type(value_type::number), valnum(valnum) {}
    value(int valnum)                   : type(value_type::number), valnum(valnum) {}
    value(double valnum)                : type(value_type::number), valnum(from_double(valnum)) {}
    value(bool valbool)                 : type(value_type::boolean), valbool(valbool) {}
    value(const char* valstr)           : type(value_type::text), valstr(valstr) {}
    value(const std::string& valstr)    : type(value_type::text), valstr(valstr) {}


    /**
     * Return the raw data members themselves.
     */
    const auto& get_number()  const { return valnum; }
    const auto& get_text()    const { return valstr; }
    auto has_type(value_type t)    const { return type == t; }
    auto is_none()                 const { return type == value_type::none; }


    /**
     * Return the truth value: booleans as-is, numbers if non-zero, text if
     * non-empty. Empty values are false.
     */
    bool as_boolean() const
    {
        switch (type)
        {
            case value_type::number  : return ! valnum.is_zero();
            case value_type::text    : return ! valstr.empty();
            case value_type::boolean : return valbool;
            default: return false;
        }
    }


    /**
     * Return this value as a number. Booleans convert to 1 or 0 and text is
     * parsed if it holds a decimal literal. Anything else raises a type
     * mismatch.
     */
    decimal as_number() const
    {
        auto d = decimal();

        switch (type)
        {
            case value_type::number  : return valnum;
            case value_type::boolean : return decimal(valbool ? 1 : 0);
            case value_type::text:
            {
                if (parse_decimal(boost::algorithm::trim_copy(valstr), d))
                {
                    return d;
                }
                throw eval_error(error_code::type_mismatch, "expected a number, got text '" + valstr + "'");
            }
            default: throw eval_error(error_code::type_mismatch, std::string("expected a number, got ") + type_name());
        }
    }


    /**
     * Return the display string for this value.
     */
    std::string as_str() const
    {
        switch (type)
        {
            case value_type::number  : return format(valnum);
            case value_type::text    : return valstr;
            case value_type::boolean : return valbool ? "TRUE" : "FALSE";
            default: return std::string();
        }
    }


    /**
     * Return the name of the value type. A missing value reports as empty.
     */
    const char* type_name() const
    {
        switch (type)
        {
            case value_type::number  : return "number";
            case value_type::text    : return "text";
            case value_type::boolean : return "boolean";
            default: return "empty";
        }
    }


    /**
     * Three-way comparison. Values of the same type compare naturally;
     * values of different types compare by their display strings.
     */
    int compare(const value& other) const
    {
        if (type == other.type)
        {
            switch (type)
            {
                case value_type::number  : return valnum < other.valnum ? -1 : (other.valnum < valnum ? 1 : 0);
                case value_type::text    : return sign(valstr.compare(other.valstr));
                case value_type::boolean : return int(valbool) - int(other.valbool);
                default: return 0;
            }
        }
        return sign(as_str().compare(other.as_str()));
    }


    bool operator==(const value& other) const { return type == other.type && compare(other) == 0; }
    bool operator!=(const value& other) const { return ! operator==(other); }


private:
    static int sign(int c) { return c < 0 ? -1 : (c > 0 ? 1 : 0); }

    value_type type;
    decimal valnum;
    std::string valstr;
    bool valbool = false;
};




//=============================================================================
#ifdef TEST_VALUE
#include <catch2/catch.hpp>
using namespace rce;




//=============================================================================
TEST_CASE("value passes basic sanity tests", "[value]")
{
    REQUIRE(value().is_none());
    REQUIRE(value::empty().has_type(value_type::empty));
    REQUIRE(value(1) == value(decimal(1)));
    REQUIRE(value(1) != value("1"));
    REQUIRE(value("a") == value(std::string("a")));
    REQUIRE(value(true).type_name() == std::string("boolean"));
    REQUIRE(value(2.5).as_str() == "2.5");
    REQUIRE(value(200.5).as_str() == "200.5");
}




TEST_CASE("value truthiness follows the value type", "[value]")
{
    REQUIRE(value(true).as_boolean());
    REQUIRE_FALSE(value(false).as_boolean());
    REQUIRE(value(3).as_boolean());
    REQUIRE_FALSE(value(0).as_boolean());
    REQUIRE(value("x").as_boolean());
    REQUIRE_FALSE(value("").as_boolean());
    REQUIRE_FALSE(value::empty().as_boolean());
    REQUIRE_FALSE(value().as_boolean());
}




TEST_CASE("value coerces to number where it can", "[value]")
{
    REQUIRE(value(true).as_number() == 1);
    REQUIRE(value(false).as_number() == 0);
    REQUIRE(value(" 12.5 ").as_number() == decimal("12.5"));
    REQUIRE_THROWS_AS(value("abc").as_number(), eval_error);
    REQUIRE_THROWS_AS(value::empty().as_number(), eval_error);
}




TEST_CASE("value comparison falls back to display strings across types", "[value]")
{
    REQUIRE(value(2).compare(value(10)) < 0);
    REQUIRE(value("b").compare(value("a")) > 0);
    REQUIRE(value(false).compare(value(true)) < 0);
    REQUIRE(value(10).compare(value("10")) == 0);
    REQUIRE(value(true).compare(value("TRUE")) == 0);
    REQUIRE(value(10).compare(value("9")) < 0);
}




TEST_CASE("literal definitions are classified", "[value]")
{
    REQUIRE(value::parse_literal("100") == value(100));
    REQUIRE(value::parse_literal("  -1.50 ").as_str() == "-1.5");
    REQUIRE(value::parse_literal("TRUE") == value(true));
    REQUIRE(value::parse_literal("false") == value(false));
    REQUIRE(value::parse_literal("'007'") == value("007"));
    REQUIRE(value::parse_literal("\"a:b\"") == value("a:b"));
    REQUIRE(value::parse_literal("Hello World") == value("Hello World"));
    REQUIRE(value::parse_literal("'") == value("'"));
    REQUIRE(value::parse_literal("   ").has_type(value_type::empty));
}



#endif // TEST_VALUE
