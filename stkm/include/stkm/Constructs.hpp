#pragma once

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stkm {

using Value = int32_t;

enum class Opcode : uint8_t
{
    PUSH  = 0x01,
    POP   = 0x02,
    ADD   = 0x03,
    SUB   = 0x04,
    MUL   = 0x05,
    DIV   = 0x06,
    DUP   = 0x07,
    SWAP  = 0x08,
    PRINT = 0x09,
    JUMP  = 0x0A,
    JZ    = 0x0B,
    HALT  = 0xFF
};

struct Instruction
{
    std::string opcode;
    std::optional<Value> operand;

    bool operator==(Instruction const&) const = default;
};

using Program = std::vector<Instruction>;

} // stkm

template <>
struct magic_enum::customize::enum_range<stkm::Opcode>
{
    static constexpr int min = 0;
    static constexpr int max = 255;
};

template <>
struct fmt::formatter<stkm::Instruction> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(stkm::Instruction const& instruction, FormatContext& context) const
    {
        auto text = instruction.operand.has_value()
                        ? fmt::format("{} {}", instruction.opcode, *instruction.operand)
                        : instruction.opcode;

        return fmt::formatter<std::string_view>::format(text, context);
    }
};
