#include "stkm/Assembler.hpp"
#include "stkm/Error.hpp"
#include "stkm/Files.hpp"

#include <liberror/Try.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>

using namespace liberror;

namespace stkm {

static std::string_view trim(std::string_view text)
{
    auto const is_space = [] (char character) { return std::isspace(static_cast<unsigned char>(character)) != 0; };

    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);

    return text;
}

static std::string to_upper(std::string_view text)
{
    std::string result(text);
    std::ranges::transform(result, result.begin(), [] (unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return result;
}

std::optional<Value> parse_integer(std::string_view token)
{
    if (token.starts_with('+'))
    {
        token.remove_prefix(1);

        if (token.starts_with('-'))
        {
            return std::nullopt;
        }
    }

    Value value {};
    auto const [end, error] = std::from_chars(token.data(), token.data() + token.size(), value);

    if (token.empty() || error != std::errc() || end != token.data() + token.size())
    {
        return std::nullopt;
    }

    return value;
}

// optional sign followed by decimal digits, whether or not it fits in 32 bits
static bool looks_like_integer(std::string_view token)
{
    if (token.starts_with('+') || token.starts_with('-'))
    {
        token.remove_prefix(1);
    }

    return !token.empty() && std::ranges::all_of(token, [] (unsigned char character) { return std::isdigit(character) != 0; });
}

static bool is_control_transfer(std::string_view opcode)
{
    return opcode == "JUMP" || opcode == "JZ";
}

Result<Program> Assembler::assemble(std::filesystem::path const& source) const
{
    auto const text = TRY(read_text(source));
    return assemble_text(text);
}

Result<Program> Assembler::assemble_text(std::string_view text) const
{
    Labels labels;
    auto const lines = TRY(scan(text, labels));
    return resolve(lines, labels);
}

Result<std::vector<Assembler::Line>> Assembler::scan(std::string_view text, Labels& labels) const
{
    std::vector<Line> lines;
    int32_t address = 0;
    size_t number = 0;

    for (auto const raw : text | std::views::split('\n'))
    {
        number += 1;

        auto line = trim(std::string_view(raw.begin(), raw.end()));

        if (auto comment = line.find('#'); comment != std::string_view::npos)
        {
            line = trim(line.substr(0, comment));
        }

        if (line.empty())
        {
            continue;
        }

        if (line.ends_with(':'))
        {
            auto const label = std::string(trim(line.substr(0, line.size() - 1)));

            if (label.empty())
            {
                return fail(ErrorKind::EMPTY_LABEL_NAME, "line {}: empty label name", number);
            }

            if (labels.contains(label))
            {
                return fail(ErrorKind::DUPLICATE_LABEL, "line {}: duplicate label '{}'", number, label);
            }

            labels.emplace(label, address);
            continue;
        }

        auto const separator = line.find_first_of(" \t\r\f\v");
        auto const opcode = to_upper(line.substr(0, separator));

        if (!registry_.contains(opcode))
        {
            return fail(ErrorKind::UNKNOWN_OPCODE, "line {}: {}", number, unknown_opcode_message(opcode, registry_.suggest(opcode)));
        }

        std::optional<std::string> operand;

        if (separator != std::string_view::npos)
        {
            operand = std::string(trim(line.substr(separator)));
        }

        lines.push_back({ number, opcode, std::move(operand) });
        address += 1;
    }

    return lines;
}

Result<Program> Assembler::resolve(std::vector<Line> const& lines, Labels const& labels) const
{
    Program program;
    program.reserve(lines.size());

    for (auto const& line : lines)
    {
        std::optional<Value> operand;

        if (line.operand.has_value() && !registry_.operand_bearing(line.opcode))
        {
            return fail(ErrorKind::INVALID_OPERAND, "line {}: {} takes no operand", line.number, line.opcode);
        }

        if (line.operand.has_value())
        {
            auto const& token = *line.operand;

            if (is_control_transfer(line.opcode) && !looks_like_integer(token))
            {
                auto label = labels.find(token);

                if (label == labels.end())
                {
                    return fail(ErrorKind::UNDEFINED_LABEL, "line {}: undefined label '{}'", line.number, token);
                }

                operand = label->second;
            }
            else if (auto value = parse_integer(token))
            {
                operand = value;
            }
            else
            {
                return fail(ErrorKind::INVALID_OPERAND, "line {}: invalid operand '{}', expected an integer{}", line.number, token, is_control_transfer(line.opcode) ? " or a label" : "");
            }
        }
        else if (registry_.operand_bearing(line.opcode))
        {
            return fail(ErrorKind::INVALID_OPERAND, "line {}: {} requires an operand", line.number, line.opcode);
        }

        program.push_back({ line.opcode, operand });
    }

    return program;
}

} // stkm
