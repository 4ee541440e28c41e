#include "stkm/Registry.hpp"
#include "stkm/Error.hpp"
#include "stkm/Similarity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace stkm {

static constexpr int32_t base_cost(Opcode opcode)
{
    switch (opcode)
    {
    case Opcode::MUL:   return 3;
    case Opcode::DIV:   return 10;
    case Opcode::JUMP:
    case Opcode::JZ:    return 2;
    case Opcode::PRINT: return 5;
    default:            return 1;
    }
}

static constexpr bool base_has_operand(Opcode opcode)
{
    return opcode == Opcode::PUSH || opcode == Opcode::JUMP || opcode == Opcode::JZ;
}

static bool is_valid_mnemonic(std::string_view name)
{
    return !name.empty() && std::ranges::all_of(name, [] (char character) {
        return (character >= 'A' && character <= 'Z') || (character >= '0' && character <= '9') || character == '_';
    });
}

std::string unknown_opcode_message(std::string_view name, std::vector<std::string> const& suggestions)
{
    if (suggestions.empty())
    {
        return fmt::format("unknown opcode '{}'", name);
    }

    return fmt::format("unknown opcode '{}' (did you mean {}?)", name, fmt::join(suggestions, ", "));
}

Registry::Registry()
{
    for (auto [opcode, name] : magic_enum::enum_entries<Opcode>())
    {
        auto const code = static_cast<uint8_t>(opcode);

        entries_.emplace(std::string(name), OpcodeInfo {
            .name = std::string(name),
            .code = code,
            .hasOperand = base_has_operand(opcode),
            .cost = base_cost(opcode),
            .behavior = {}
        });

        byCode_.emplace(code, std::string(name));
    }
}

liberror::Result<void> Registry::register_extension(std::string name, uint8_t code, bool hasOperand, Behavior behavior, int32_t cost)
{
    if (!is_valid_mnemonic(name))
    {
        return fail(ErrorKind::EXTENSION_LOAD, "'{}' is not a valid mnemonic", name);
    }

    if (!behavior)
    {
        return fail(ErrorKind::EXTENSION_LOAD, "extension {} has no behaviour", name);
    }

    if (entries_.contains(name))
    {
        return fail(ErrorKind::NAME_CONFLICT, "opcode {} is already registered", name);
    }

    if (auto existing = byCode_.find(code); existing != byCode_.end())
    {
        return fail(ErrorKind::CODE_CONFLICT, "opcode value 0x{:02x} requested by {} is already taken by {}", code, name, existing->second);
    }

    byCode_.emplace(code, name);
    entries_.emplace(name, OpcodeInfo {
        .name = name,
        .code = code,
        .hasOperand = hasOperand,
        .cost = cost,
        .behavior = std::move(behavior)
    });

    return {};
}

liberror::Result<void> Registry::register_extension(Extension extension)
{
    return register_extension(std::move(extension.name), extension.code, extension.hasOperand, std::move(extension.behavior), extension.cost);
}

OpcodeInfo const* Registry::find(std::string_view name) const
{
    auto entry = entries_.find(name);
    return entry != entries_.end() ? &entry->second : nullptr;
}

liberror::Result<OpcodeInfo const*> Registry::lookup_by_name(std::string_view name) const
{
    if (auto const* info = find(name))
    {
        return info;
    }

    return fail(ErrorKind::UNKNOWN_OPCODE, "{}", unknown_opcode_message(name, suggest(name)));
}

liberror::Result<OpcodeInfo const*> Registry::lookup_by_code(uint8_t code) const
{
    auto name = byCode_.find(code);

    if (name == byCode_.end())
    {
        return fail(ErrorKind::UNKNOWN_OPCODE_NUMBER, "unknown opcode number 0x{:02x}", code);
    }

    return find(name->second);
}

bool Registry::contains(std::string_view name) const
{
    return find(name) != nullptr;
}

bool Registry::is_extension(std::string_view name) const
{
    auto const* info = find(name);
    return info != nullptr && static_cast<bool>(info->behavior);
}

bool Registry::operand_bearing(std::string_view name) const
{
    auto const* info = find(name);
    return info != nullptr && info->hasOperand;
}

std::vector<std::string> Registry::names() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());

    for (auto const& [name, info] : entries_)
    {
        names.push_back(name);
    }

    return names;
}

std::vector<std::string> Registry::suggest(std::string_view name) const
{
    auto const known = names();
    return closest_matches(name, known);
}

void Registry::retain(std::shared_ptr<void> library)
{
    libraries_.push_back(std::move(library));
}

} // stkm
