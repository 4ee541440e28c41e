#pragma once

#include "stkm/Constructs.hpp"
#include "stkm/Registry.hpp"

#include <liberror/Result.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace stkm {

//
// STKM bytecode, all integers little-endian
//
//   [0:4]  magic "STKM"
//   [4]    version
//   [5:9]  instruction count (u32)
//   then per instruction: opcode (u8), operand (i32, 0 when absent)
//
static constexpr std::string_view MAGIC = "STKM";
static constexpr uint8_t VERSION = 1;
static constexpr size_t HEADER_SIZE = 9;
static constexpr size_t RECORD_SIZE = 5;

constexpr size_t record_offset(size_t index)
{
    return HEADER_SIZE + index * RECORD_SIZE;
}

struct Record
{
    Instruction instruction;
    uint8_t code;
    size_t offset;
    std::array<uint8_t, RECORD_SIZE> raw;
};

class Codec
{
public:
    explicit Codec(Registry const& registry)
        : registry_(registry)
    {}

public:
    liberror::Result<std::vector<uint8_t>> encode(Program const& program) const;

    liberror::Result<Program> decode(std::span<uint8_t const> bytes) const;
    liberror::Result<std::vector<Record>> decode_records(std::span<uint8_t const> bytes) const;

private:
    Registry const& registry_;
};

} // stkm
