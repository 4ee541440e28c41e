#pragma once

#include "stkm/Constructs.hpp"
#include "stkm/Registry.hpp"

#include <liberror/Result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stkm {

class Assembler
{
public:
    explicit Assembler(Registry const& registry)
        : registry_(registry)
    {}

public:
    liberror::Result<Program> assemble(std::filesystem::path const& source) const;
    liberror::Result<Program> assemble_text(std::string_view text) const;

private:
    struct Line
    {
        size_t number;
        std::string opcode;
        std::optional<std::string> operand;
    };

    using Labels = std::unordered_map<std::string, int32_t>;

    liberror::Result<std::vector<Line>> scan(std::string_view text, Labels& labels) const;
    liberror::Result<Program> resolve(std::vector<Line> const& lines, Labels const& labels) const;

private:
    Registry const& registry_;
};

std::optional<Value> parse_integer(std::string_view token);

} // stkm
