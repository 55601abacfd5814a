#pragma once
#include <functional>
#include <string>
#include <vector>
#include "rce-value.hpp"




//=============================================================================
namespace rce {

    using args_t = std::vector<value>;
    using func_t = std::function<value(const args_t&)>;


    /**
     * An entry in the table of built-in functions. A max_args of -1 means
     * the function is variadic. Special forms (if, ifs) have no func: their
     * arguments are evaluated lazily by the expression tree itself.
     */
    struct builtin_t
    {
        std::string name;
        int min_args = 0;
        int max_args = 0;
        func_t func;
    };


    namespace core {

        value sqrt  (const args_t& a);
        value abs   (const args_t& a);
        value ceil  (const args_t& a);
        value floor (const args_t& a);
        value round (const args_t& a);
        value sin   (const args_t& a);
        value cos   (const args_t& a);
        value tan   (const args_t& a);
        value asin  (const args_t& a);
        value acos  (const args_t& a);
        value atan  (const args_t& a);
        value sinh  (const args_t& a);
        value cosh  (const args_t& a);
        value tanh  (const args_t& a);
        value log   (const args_t& a);
        value log10 (const args_t& a);
        value exp   (const args_t& a);
        value pow   (const args_t& a);
        value min   (const args_t& a);
        value max   (const args_t& a);
        value avg   (const args_t& a);
        value and_  (const args_t& a);
        value or_   (const args_t& a);
        value not_  (const args_t& a);
        value xor_  (const args_t& a);

        /**
         * Arithmetic shared by the operators and the functions above. Each
         * result is quantized; division by zero and non-finite results
         * raise eval_error.
         */
        decimal add      (const decimal& a, const decimal& b);
        decimal subtract (const decimal& a, const decimal& b);
        decimal multiply (const decimal& a, const decimal& b);
        decimal divide   (const decimal& a, const decimal& b);
        decimal floordiv (const decimal& a, const decimal& b);
        decimal modulo   (const decimal& a, const decimal& b);
        decimal power    (const decimal& a, const decimal& b);

        /**
         * Look up a built-in by name, case-insensitively. Returns nullptr if
         * there is no such function.
         */
        const builtin_t* find(const std::string& name);

        /**
         * Throw an arity mismatch unless num_args is acceptable to f.
         */
        void check_arity(const builtin_t& f, std::size_t num_args);

        const std::vector<builtin_t>& table();
    }
}
