#include <cmath>
#include <map>
#include <boost/algorithm/string.hpp>
#include "rce-core.hpp"

namespace mp = boost::multiprecision;




//=============================================================================
namespace {

    rce::decimal checked(const rce::decimal& x)
    {
        if (! (mp::isfinite)(x))
        {
            throw rce::eval_error(rce::error_code::domain, "domain error: result is not a finite number");
        }
        return rce::quantize(x);
    }

    rce::decimal number_arg(const rce::args_t& a, std::size_t n)
    {
        return a.at(n).as_number();
    }

    rce::eval_error domain_failure(const std::string& name, const rce::decimal& x)
    {
        return rce::eval_error(rce::error_code::domain, "domain error: " + name + "(" + rce::format(x) + ")");
    }

    rce::eval_error division_by_zero()
    {
        return rce::eval_error(rce::error_code::division_by_zero, "division by zero");
    }
}




//=============================================================================
const std::vector<rce::builtin_t>& rce::core::table()
{
    static const std::vector<builtin_t> builtins = {
        {"sqrt",  1,  1, sqrt},
        {"abs",   1,  1, abs},
        {"ceil",  1,  1, ceil},
        {"floor", 1,  1, floor},
        {"round", 1,  2, round},
        {"sin",   1,  1, sin},
        {"cos",   1,  1, cos},
        {"tan",   1,  1, tan},
        {"asin",  1,  1, asin},
        {"acos",  1,  1, acos},
        {"atan",  1,  1, atan},
        {"sinh",  1,  1, sinh},
        {"cosh",  1,  1, cosh},
        {"tanh",  1,  1, tanh},
        {"log",   1,  1, log},
        {"log10", 1,  1, log10},
        {"exp",   1,  1, exp},
        {"pow",   2,  2, pow},
        {"min",   1, -1, min},
        {"max",   1, -1, max},
        {"avg",   1, -1, avg},
        {"and",   1, -1, and_},
        {"or",    1, -1, or_},
        {"not",   1,  1, not_},
        {"xor",   1, -1, xor_},
        {"if",    3,  3, nullptr},
        {"ifs",   2, -1, nullptr},
    };
    return builtins;
}

const rce::builtin_t* rce::core::find(const std::string& name)
{
    static const auto index = [] ()
    {
        auto result = std::map<std::string, const builtin_t*>();

        for (const auto& f : table())
        {
            result[f.name] = &f;
        }
        return result;
    }();

    auto f = index.find(boost::algorithm::to_lower_copy(name));
    return f == index.end() ? nullptr : f->second;
}

void rce::core::check_arity(const builtin_t& f, std::size_t num_args)
{
    auto n = int(num_args);

    if (n >= f.min_args && (f.max_args == -1 || n <= f.max_args))
    {
        return;
    }

    auto expected = std::to_string(f.min_args);

    if (f.max_args == -1)
    {
        expected = "at least " + expected;
    }
    else if (f.max_args != f.min_args)
    {
        expected += " to " + std::to_string(f.max_args);
    }
    throw eval_error(error_code::arity_mismatch,
        "arity mismatch: " + f.name + " expects " + expected + " argument(s), got " + std::to_string(n));
}




//=============================================================================
rce::decimal rce::core::add(const decimal& a, const decimal& b)
{
    return checked(a + b);
}

rce::decimal rce::core::subtract(const decimal& a, const decimal& b)
{
    return checked(a - b);
}

rce::decimal rce::core::multiply(const decimal& a, const decimal& b)
{
    return checked(a * b);
}

rce::decimal rce::core::divide(const decimal& a, const decimal& b)
{
    if (b.is_zero())
    {
        throw division_by_zero();
    }
    return checked(a / b);
}

rce::decimal rce::core::floordiv(const decimal& a, const decimal& b)
{
    if (b.is_zero())
    {
        throw division_by_zero();
    }
    return checked(mp::floor(a / b));
}

rce::decimal rce::core::modulo(const decimal& a, const decimal& b)
{
    if (b.is_zero())
    {
        throw division_by_zero();
    }
    auto r = a - b * mp::trunc(a / b);

    if (r < 0)
    {
        r += mp::abs(b);
    }
    return checked(r);
}

rce::decimal rce::core::power(const decimal& a, const decimal& b)
{
    auto x = std::pow(a.convert_to<double>(), b.convert_to<double>());

    if (! std::isfinite(x))
    {
        throw eval_error(error_code::domain, "domain error: " + format(a) + " ^ " + format(b));
    }
    return from_double(x);
}




//=============================================================================
rce::value rce::core::sqrt(const args_t& a)
{
    auto x = number_arg(a, 0);

    if (x < 0)
    {
        throw domain_failure("sqrt", x);
    }
    return checked(mp::sqrt(x));
}

rce::value rce::core::abs(const args_t& a)
{
    return checked(mp::abs(number_arg(a, 0)));
}

rce::value rce::core::ceil(const args_t& a)
{
    return checked(mp::ceil(number_arg(a, 0)));
}

rce::value rce::core::floor(const args_t& a)
{
    return checked(mp::floor(number_arg(a, 0)));
}

/**
 * Round half-up (away from zero) to n decimal places; n defaults to zero and
 * may be negative.
 */
rce::value rce::core::round(const args_t& a)
{
    auto x = number_arg(a, 0);
    auto n = a.size() > 1 ? mp::trunc(number_arg(a, 1)).convert_to<int>() : 0;
    auto scale = decimal(("1e" + std::to_string(n)).c_str());
    auto unscale = decimal(("1e" + std::to_string(-n)).c_str());
    auto r = mp::floor(mp::abs(x) * scale + decimal("0.5")) * unscale;
    return checked(x < 0 ? decimal(-r) : r);
}

rce::value rce::core::sin(const args_t& a)
{
    return checked(mp::sin(number_arg(a, 0)));
}

rce::value rce::core::cos(const args_t& a)
{
    return checked(mp::cos(number_arg(a, 0)));
}

rce::value rce::core::tan(const args_t& a)
{
    return checked(mp::tan(number_arg(a, 0)));
}

rce::value rce::core::asin(const args_t& a)
{
    auto x = number_arg(a, 0);

    if (x < -1 || x > 1)
    {
        throw domain_failure("asin", x);
    }
    return checked(mp::asin(x));
}

rce::value rce::core::acos(const args_t& a)
{
    auto x = number_arg(a, 0);

    if (x < -1 || x > 1)
    {
        throw domain_failure("acos", x);
    }
    return checked(mp::acos(x));
}

rce::value rce::core::atan(const args_t& a)
{
    return checked(mp::atan(number_arg(a, 0)));
}

rce::value rce::core::sinh(const args_t& a)
{
    return checked(mp::sinh(number_arg(a, 0)));
}

rce::value rce::core::cosh(const args_t& a)
{
    return checked(mp::cosh(number_arg(a, 0)));
}

rce::value rce::core::tanh(const args_t& a)
{
    return checked(mp::tanh(number_arg(a, 0)));
}

rce::value rce::core::log(const args_t& a)
{
    auto x = number_arg(a, 0);

    if (x <= 0)
    {
        throw domain_failure("log", x);
    }
    return checked(mp::log(x));
}

rce::value rce::core::log10(const args_t& a)
{
    auto x = number_arg(a, 0);

    if (x <= 0)
    {
        throw domain_failure("log10", x);
    }
    return checked(mp::log10(x));
}

rce::value rce::core::exp(const args_t& a)
{
    return checked(mp::exp(number_arg(a, 0)));
}

rce::value rce::core::pow(const args_t& a)
{
    return power(number_arg(a, 0), number_arg(a, 1));
}

rce::value rce::core::min(const args_t& a)
{
    auto result = number_arg(a, 0);

    for (std::size_t n = 1; n < a.size(); ++n)
    {
        auto x = number_arg(a, n);

        if (x < result)
            result = x;
    }
    return result;
}

rce::value rce::core::max(const args_t& a)
{
    auto result = number_arg(a, 0);

    for (std::size_t n = 1; n < a.size(); ++n)
    {
        auto x = number_arg(a, n);

        if (x > result)
            result = x;
    }
    return result;
}

rce::value rce::core::avg(const args_t& a)
{
    auto sum = decimal(0);

    for (std::size_t n = 0; n < a.size(); ++n)
    {
        sum += number_arg(a, n);
    }
    return checked(sum / decimal(int(a.size())));
}

rce::value rce::core::and_(const args_t& a)
{
    for (const auto& v : a)
        if (! v.as_boolean())
            return false;
    return true;
}

rce::value rce::core::or_(const args_t& a)
{
    for (const auto& v : a)
        if (v.as_boolean())
            return true;
    return false;
}

rce::value rce::core::not_(const args_t& a)
{
    return ! a.at(0).as_boolean();
}

rce::value rce::core::xor_(const args_t& a)
{
    bool result = false;

    for (const auto& v : a)
        if (v.as_boolean())
            result = ! result;
    return result;
}
