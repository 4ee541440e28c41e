#include <stkm/Diagnostic.hpp>
#include <stkm/Disassembler.hpp>
#include <stkm/Files.hpp>
#include <stkm/Registry.hpp>
#include <stkm/Toolchain.hpp>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <liberror/Result.hpp>
#include <liberror/Try.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <span>

using namespace liberror;

Result<void> safe_main(std::span<char const*> arguments)
{
    argparse::ArgumentParser args("stkp", "", argparse::default_arguments::help);
    args.add_description("stkm disassembler: turns STKM bytecode back into source");

    args.add_argument("-f", "--file").help("bytecode to be disassembled");
    args.add_argument("-o", "--output").help("source destination (defaults to stdout)");
    args.add_argument("-e", "--extensions").help("directory of extension plugins to load");
    args.add_argument("-a", "--addresses").help("annotate every instruction with its file offset").default_value(false).implicit_value(true);
    args.add_argument("-v", "--verbose").help("annotate with file offset, raw bytes and opcode value").default_value(false).implicit_value(true);
    args.add_argument("--list-opcodes").help("list every known opcode and exit").default_value(false).implicit_value(true);

    try
    {
        args.parse_args(static_cast<int>(arguments.size()), arguments.data());
    }
    catch (std::exception const& exception)
    {
        return liberror::make_error(exception.what());
    }

    stkm::Registry registry;

    std::optional<std::filesystem::path> extensions;
    if (auto directory = args.present("--extensions")) extensions = *directory;

    stkm::prepare_registry(registry, extensions, false);

    if (args.get<bool>("--list-opcodes"))
    {
        fmt::print("{}", stkm::format_opcodes(registry));
        return {};
    }

    auto const file = args.present("--file");

    if (!file.has_value())
    {
        return make_error("no bytecode given, see --help");
    }

    auto const level = args.get<bool>("--verbose") ? 2 : args.get<bool>("--addresses") ? 1 : 0;
    auto const annotation = stkm::Annotation::from_int(level);

    std::filesystem::path const bytecode = *file;
    auto const text = TRY(stkm::Disassembler(registry).disassemble(bytecode, annotation));

    if (auto output = args.present("--output"))
    {
        TRY(stkm::write_file(*output, std::string_view(text)));
        fmt::print("Disassembled '{}' to '{}'\n", bytecode.string(), *output);
        return {};
    }

    fmt::print("{}", text);

    return {};
}

int main(int argc, char const** argv)
{
    auto result = safe_main(std::span<char const*>(argv, size_t(argc)));

    if (!result.has_value())
    {
        stkm::report_error(result.error().message());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
