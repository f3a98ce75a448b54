#pragma once

#include <limits>
#include <eosio/eosio.hpp>

namespace wasm { namespace safemath {

    static constexpr uint128_t MAX_UINT128 = ~uint128_t(0);

    template<typename T>
    int64_t multiply_decimal_down(uint128_t a, uint128_t b, T precision) {
        eosio::check(b == 0 || a <= MAX_UINT128 / b, "overflow exception of multiply_decimal_down");
        eosio::check(precision > 0, "divide by zero in multiply_decimal_down");
        uint128_t tmp = a * b / precision;
        eosio::check(tmp <= (uint128_t)std::numeric_limits<int64_t>::max(), "overflow exception of multiply_decimal_down");
        return (int64_t)tmp;
    }

    template<typename T>
    int64_t divide_decimal_down(uint128_t a, uint128_t b, T precision) {
        eosio::check(b > 0, "divide by zero in divide_decimal_down");
        eosio::check(precision == 0 || a <= MAX_UINT128 / (uint128_t)precision, "overflow exception of divide_decimal_down");
        uint128_t tmp = a * precision / b;
        eosio::check(tmp <= (uint128_t)std::numeric_limits<int64_t>::max(), "overflow exception of divide_decimal_down");
        return (int64_t)tmp;
    }

    #define mul_down(a, b, p) multiply_decimal_down(a, b, p)
    #define div_down(a, b, p) divide_decimal_down(a, b, p)

} } //safemath
