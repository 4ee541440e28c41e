#include "stkm/Disassembler.hpp"
#include "stkm/Files.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <liberror/Try.hpp>

using namespace liberror;

namespace stkm {

static std::string annotate(Record const& record, Annotation annotation)
{
    switch (annotation)
    {
    case Annotation::NONE: {
        return fmt::format("{}", record.instruction);
    }
    case Annotation::OFFSETS: {
        return fmt::format("{:<20} # @0x{:04x}", record.instruction, record.offset);
    }
    case Annotation::VERBOSE: {
        return fmt::format("{:<20} # @0x{:04x}: {:02x} (op=0x{:02x})", record.instruction, record.offset, fmt::join(record.raw, " "), record.code);
    }
    }

    return fmt::format("{}", record.instruction);
}

Result<std::string> Disassembler::render(std::span<uint8_t const> bytecode, std::string_view origin, Annotation annotation) const
{
    auto const records = TRY(codec_.decode_records(bytecode));

    std::string text;

    if (!origin.empty())
    {
        text += fmt::format("# Disassembled from {}\n", origin);
    }

    text += fmt::format("# {} instructions\n\n", records.size());

    for (auto const& record : records)
    {
        text += annotate(record, annotation);
        text += '\n';
    }

    return text;
}

Result<std::string> Disassembler::disassemble(std::span<uint8_t const> bytecode, Annotation annotation) const
{
    return render(bytecode, {}, annotation);
}

Result<std::string> Disassembler::disassemble(std::filesystem::path const& bytecode, Annotation annotation) const
{
    auto const bytes = TRY(read_bytes(bytecode));
    return render(bytes, bytecode.string(), annotation);
}

} // stkm
