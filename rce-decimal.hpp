#pragma once
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ios>
#include <stdexcept>
#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>




//=============================================================================
namespace rce
{


    //=========================================================================
    using decimal = boost::multiprecision::number<
        boost::multiprecision::cpp_dec_float<34>,
        boost::multiprecision::et_off>;


    /** Number of significant digits kept by every arithmetic result. */
    static const std::size_t decimal_digits = 34;


    //=========================================================================
    struct digits_t
    {
        bool negative = false;
        std::string digits;
        long exponent = 0;
    };


    //=========================================================================
    inline digits_t decompose(const decimal& x);
    inline decimal quantize(const decimal& x);
    inline std::string format(const decimal& x);
    inline bool parse_decimal(const std::string& source, decimal& result);
    inline decimal from_double(double x);
}




//=============================================================================
/**
 * Return the sign, significant digits, and decimal exponent of x, rounded
 * half-up to decimal_digits and with trailing zeros removed, so that
 *
 *                 x = (-1)^negative * d.ddd * 10^exponent .
 *
 * Zero is represented as the single digit "0". Throws std::domain_error if x
 * is not a finite number.
 */
rce::digits_t rce::decompose(const decimal& x)
{
    auto d = digits_t();

    if (! (boost::multiprecision::isfinite)(x))
    {
        throw std::domain_error("result is not a finite number");
    }
    if (x.is_zero())
    {
        d.digits = "0";
        return d;
    }

    auto s = x.str(0, std::ios_base::scientific);
    auto e = s.find_first_of("eE");
    auto c = std::size_t(0);

    if (s[c] == '-')
    {
        d.negative = true;
        ++c;
    }
    for (; c < e; ++c)
    {
        if (std::isdigit(static_cast<unsigned char>(s[c])))
        {
            d.digits.push_back(s[c]);
        }
    }
    d.exponent = std::stol(s.substr(e + 1));

    while (d.digits.size() > 1 && d.digits.front() == '0')
    {
        d.digits.erase(0, 1);
        --d.exponent;
    }

    if (d.digits.size() > decimal_digits)
    {
        bool round_up = d.digits[decimal_digits] >= '5';
        d.digits.resize(decimal_digits);

        if (round_up)
        {
            auto n = long(decimal_digits) - 1;

            while (n >= 0 && d.digits[n] == '9')
            {
                d.digits[n--] = '0';
            }
            if (n < 0)
            {
                d.digits.insert(0, "1");
                d.digits.pop_back();
                ++d.exponent;
            }
            else
            {
                ++d.digits[n];
            }
        }
    }

    while (d.digits.size() > 1 && d.digits.back() == '0')
    {
        d.digits.pop_back();
    }
    return d;
}


/**
 * Round x to decimal_digits significant digits, ties away from zero.
 */
rce::decimal rce::quantize(const decimal& x)
{
    auto d = decompose(x);

    if (d.digits == "0")
    {
        return decimal(0);
    }

    auto s = std::string(d.negative ? "-" : "") + d.digits.substr(0, 1);

    if (d.digits.size() > 1)
    {
        s += "." + d.digits.substr(1);
    }
    return decimal((s + "e" + std::to_string(d.exponent)).c_str());
}


/**
 * Render x for display. Trailing fractional zeros are stripped, and the
 * plain notation is used unless the number has more than 15 integer digits
 * or its leading digit sits more than 6 places right of the decimal point.
 * Those cases are written as 1.5E+20 or 2E-7.
 */
std::string rce::format(const decimal& x)
{
    auto d = decompose(x);

    if (d.digits == "0")
    {
        return "0";
    }

    auto sign = std::string(d.negative ? "-" : "");
    auto n = long(d.digits.size());

    if (d.exponent >= 15 || d.exponent < -6)
    {
        auto mantissa = d.digits.substr(0, 1) + (n > 1 ? "." + d.digits.substr(1) : "");
        auto exponent = (d.exponent >= 0 ? "E+" : "E-") + std::to_string(std::labs(d.exponent));
        return sign + mantissa + exponent;
    }
    if (d.exponent < 0)
    {
        return sign + "0." + std::string(-d.exponent - 1, '0') + d.digits;
    }
    if (n <= d.exponent + 1)
    {
        return sign + d.digits + std::string(d.exponent + 1 - n, '0');
    }
    return sign + d.digits.substr(0, d.exponent + 1) + "." + d.digits.substr(d.exponent + 1);
}


/**
 * Parse a decimal literal of the form [+-]digits[.digits][(e|E)[+-]digits].
 * The integer part may be omitted if a fractional part is present (.5).
 * Returns false, leaving result untouched, if the whole string is not such a
 * literal.
 */
bool rce::parse_decimal(const std::string& source, decimal& result)
{
    auto c = source.data();
    auto start = c;
    auto digits = 0;

    if (*c == '+' || *c == '-')
    {
        ++c;
    }
    while (std::isdigit(static_cast<unsigned char>(*c)))
    {
        ++c;
        ++digits;
    }
    if (*c == '.')
    {
        ++c;

        while (std::isdigit(static_cast<unsigned char>(*c)))
        {
            ++c;
            ++digits;
        }
    }
    if (digits == 0)
    {
        return false;
    }
    if (*c == 'e' || *c == 'E')
    {
        ++c;

        if (*c == '+' || *c == '-')
        {
            ++c;
        }
        if (! std::isdigit(static_cast<unsigned char>(*c)))
        {
            return false;
        }
        while (std::isdigit(static_cast<unsigned char>(*c)))
        {
            ++c;
        }
    }
    if (std::size_t(c - start) != source.size())
    {
        return false;
    }
    result = quantize(decimal(source.c_str() + (source[0] == '+' ? 1 : 0)));
    return true;
}


/**
 * Convert a double using the shortest decimal string that reads back as the
 * same double, so that 0.1 becomes exactly 0.1. Throws std::domain_error for
 * infinities and NaN.
 */
rce::decimal rce::from_double(double x)
{
    if (! std::isfinite(x))
    {
        throw std::domain_error("result is not a finite number");
    }

    char buffer[32];

    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, x);

        if (std::strtod(buffer, nullptr) == x)
        {
            break;
        }
    }
    return quantize(decimal(buffer));
}




//=============================================================================
#ifdef TEST_DECIMAL
#include <catch2/catch.hpp>
using namespace rce;




//=============================================================================
TEST_CASE("decimal arithmetic is exact for short fractions", "[decimal]")
{
    REQUIRE(format(quantize(decimal("0.1") + decimal("0.2"))) == "0.3");
    REQUIRE(format(quantize(decimal("200.5") / decimal(100))) == "2.005");
    REQUIRE(format(quantize(decimal(100) * decimal("200.5"))) == "20050");
    REQUIRE(format(decimal("-12.500")) == "-12.5");
    REQUIRE(format(decimal(0)) == "0");
}




TEST_CASE("quantize keeps 34 digits and rounds half up", "[decimal]")
{
    auto third = quantize(decimal(1) / decimal(3));
    REQUIRE(format(third) == "0." + std::string(34, '3'));

    auto two_thirds = quantize(decimal(2) / decimal(3));
    REQUIRE(format(two_thirds) == "0." + std::string(33, '6') + "7");

    auto tie = quantize(decimal(("1." + std::string(33, '0') + "5").c_str()));
    REQUIRE(format(tie) == "1." + std::string(32, '0') + "1");

    auto carry = quantize(decimal(std::string(35, '9').c_str()));
    REQUIRE(format(carry) == "1E+35");
}




TEST_CASE("format switches to exponential notation at the thresholds", "[decimal]")
{
    REQUIRE(format(decimal("123456789012345")) == "123456789012345");
    REQUIRE(format(decimal("1234567890123456")) == "1.234567890123456E+15");
    REQUIRE(format(decimal("0.000001")) == "0.000001");
    REQUIRE(format(decimal("0.0000001")) == "1E-7");
    REQUIRE(format(decimal("-0.00000025")) == "-2.5E-7");
    REQUIRE(format(decimal("1000")) == "1000");
}




TEST_CASE("decimal literals are parsed strictly", "[decimal]")
{
    decimal d;

    REQUIRE(parse_decimal("42", d));
    REQUIRE(d == 42);
    REQUIRE(parse_decimal("+1.5", d));
    REQUIRE(format(d) == "1.5");
    REQUIRE(parse_decimal(".5", d));
    REQUIRE(format(d) == "0.5");
    REQUIRE(parse_decimal("-2e3", d));
    REQUIRE(format(d) == "-2000");
    REQUIRE_FALSE(parse_decimal("", d));
    REQUIRE_FALSE(parse_decimal("-", d));
    REQUIRE_FALSE(parse_decimal("1.2.3", d));
    REQUIRE_FALSE(parse_decimal("12abc", d));
    REQUIRE_FALSE(parse_decimal("1e", d));
    REQUIRE_FALSE(parse_decimal(" 1", d));
}




TEST_CASE("doubles convert through their shortest representation", "[decimal]")
{
    REQUIRE(format(from_double(0.1)) == "0.1");
    REQUIRE(format(from_double(200.5)) == "200.5");
    REQUIRE(format(from_double(-3.0)) == "-3");
    REQUIRE(format(from_double(1e20)) == "1E+20");
    REQUIRE_THROWS_AS(from_double(HUGE_VAL), std::domain_error);
}



#endif // TEST_DECIMAL
