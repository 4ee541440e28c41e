#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <span>

namespace stkm {

// the bytecode is little-endian throughout

inline uint32_t bytes_2_uint(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
{
    return static_cast<uint32_t>(a) << 0 | static_cast<uint32_t>(b) << 8 | static_cast<uint32_t>(c) << 16 | static_cast<uint32_t>(d) << 24;
}

inline uint32_t bytes_2_uint(std::span<uint8_t const> bytes)
{
    assert(bytes.size() == 4);
    return bytes_2_uint(bytes[0], bytes[1], bytes[2], bytes[3]);
}

inline int32_t bytes_2_int(std::span<uint8_t const> bytes)
{
    return static_cast<int32_t>(bytes_2_uint(bytes));
}

inline std::array<uint8_t, 4> uint_2_bytes(uint32_t value)
{
    return {
        static_cast<uint8_t>((value >> 0)  & 0xFF),
        static_cast<uint8_t>((value >> 8)  & 0xFF),
        static_cast<uint8_t>((value >> 16) & 0xFF),
        static_cast<uint8_t>((value >> 24) & 0xFF),
    };
}

inline std::array<uint8_t, 4> int_2_bytes(int32_t value)
{
    return uint_2_bytes(static_cast<uint32_t>(value));
}

} // stkm
