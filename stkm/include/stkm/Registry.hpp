#pragma once

#include "stkm/Constructs.hpp"

#include <liberror/Result.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stkm {

class Machine;

using Behavior = std::function<liberror::Result<void>(Machine&, std::optional<Value>)>;

struct OpcodeInfo
{
    std::string name;
    uint8_t code;
    bool hasOperand;
    int32_t cost;

    // empty for the base instruction set, which the machine dispatches itself
    Behavior behavior;
};

struct Extension
{
    std::string name;
    uint8_t code;
    bool hasOperand;
    Behavior behavior;
    int32_t cost = 1;
};

//
// The instruction set: the fixed base opcodes plus whatever extensions were
// registered at startup. Built once, then shared read-only by the assembler,
// the codec, the disassembler and any number of machines.
//
class Registry
{
public:
    Registry();

    Registry(Registry const&) = delete;
    Registry& operator=(Registry const&) = delete;

public:
    liberror::Result<void> register_extension(std::string name, uint8_t code, bool hasOperand, Behavior behavior, int32_t cost = 1);
    liberror::Result<void> register_extension(Extension extension);

    liberror::Result<OpcodeInfo const*> lookup_by_name(std::string_view name) const;
    liberror::Result<OpcodeInfo const*> lookup_by_code(uint8_t code) const;

    bool contains(std::string_view name) const;
    bool is_extension(std::string_view name) const;
    bool operand_bearing(std::string_view name) const;

    std::vector<std::string> names() const;
    std::vector<std::string> suggest(std::string_view name) const;

    // keeps a plugin loaded for as long as its behaviours may be called
    void retain(std::shared_ptr<void> library);

private:
    OpcodeInfo const* find(std::string_view name) const;

private:
    // declared first so the libraries outlive the behaviours they provide
    std::vector<std::shared_ptr<void>> libraries_;

    std::map<std::string, OpcodeInfo, std::less<>> entries_;
    std::unordered_map<uint8_t, std::string> byCode_;
};

std::string unknown_opcode_message(std::string_view name, std::vector<std::string> const& suggestions);

} // stkm
