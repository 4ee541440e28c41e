#pragma once

#include <cstdint>

namespace stkm {

// quotient rounded toward negative infinity; b must not be zero
constexpr int64_t floor_div(int64_t a, int64_t b)
{
    auto quotient = a / b;

    if ((a % b != 0) && ((a < 0) != (b < 0)))
    {
        quotient -= 1;
    }

    return quotient;
}

// remainder taking the sign of the divisor; b must not be zero
constexpr int64_t floor_mod(int64_t a, int64_t b)
{
    auto remainder = a % b;

    if (remainder != 0 && ((remainder < 0) != (b < 0)))
    {
        remainder += b;
    }

    return remainder;
}

} // stkm
