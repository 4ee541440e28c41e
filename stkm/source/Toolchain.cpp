#include "stkm/Toolchain.hpp"
#include "stkm/Assembler.hpp"
#include "stkm/Bytecode.hpp"
#include "stkm/Diagnostic.hpp"
#include "stkm/Extensions.hpp"
#include "stkm/Files.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <liberror/Try.hpp>

using namespace liberror;

namespace stkm {

void prepare_registry(Registry& registry, std::optional<std::filesystem::path> const& extensions, bool verbose)
{
    report_extensions(register_standard_extensions(registry), false);

    if (!extensions.has_value())
    {
        return;
    }

    if (!std::filesystem::is_directory(*extensions))
    {
        report_warning(fmt::format("extension directory '{}' does not exist", extensions->string()));
        return;
    }

    report_extensions(load_extensions(registry, *extensions), verbose);
}

std::filesystem::path default_output(std::filesystem::path const& source)
{
    auto output = source;
    output.replace_extension(".stkm");
    return output;
}

Result<size_t> compile(Registry const& registry, std::filesystem::path const& source, std::filesystem::path const& output)
{
    auto const program = TRY(Assembler(registry).assemble(source));
    auto const bytes = TRY(Codec(registry).encode(program));

    TRY(write_file(output, bytes));

    return program.size();
}

Result<Program> load_bytecode(Registry const& registry, std::filesystem::path const& bytecode)
{
    auto const bytes = TRY(read_bytes(bytecode));
    return Codec(registry).decode(bytes);
}

std::string format_snapshot(Snapshot const& snapshot)
{
    return fmt::format("PC:{:3d} {:<12} Stack: [{}]", snapshot.programCounter, snapshot.instruction, fmt::join(snapshot.stack, ", "));
}

std::string format_opcodes(Registry const& registry)
{
    std::string text;

    for (auto const& name : registry.names())
    {
        auto const* info = registry.lookup_by_name(name).value();

        text += fmt::format("{:<8} 0x{:02x} cost={:<3}{}{}\n", info->name, info->code, info->cost,
                            info->hasOperand ? " operand" : "",
                            info->behavior ? " extension" : "");
    }

    return text;
}

} // stkm
