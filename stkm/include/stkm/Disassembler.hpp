#pragma once

#include "stkm/Bytecode.hpp"
#include "stkm/Registry.hpp"

#include <libenum/Enum.hpp>
#include <liberror/Result.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace stkm {

ENUM_CLASS(Annotation, NONE, OFFSETS, VERBOSE);

class Disassembler
{
public:
    explicit Disassembler(Registry const& registry)
        : codec_(registry)
    {}

public:
    liberror::Result<std::string> disassemble(std::span<uint8_t const> bytecode, Annotation annotation = Annotation::NONE) const;
    liberror::Result<std::string> disassemble(std::filesystem::path const& bytecode, Annotation annotation = Annotation::NONE) const;

private:
    liberror::Result<std::string> render(std::span<uint8_t const> bytecode, std::string_view origin, Annotation annotation) const;

private:
    Codec codec_;
};

} // stkm
