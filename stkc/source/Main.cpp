#include <stkm/Diagnostic.hpp>
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
    argparse::ArgumentParser args("stkc", "", argparse::default_arguments::help);
    args.add_description("stkm assembler: compiles source into STKM bytecode");

    args.add_argument("-f", "--file").help("source to be compiled");
    args.add_argument("-o", "--output").help("bytecode destination (defaults to the source with a .stkm extension)");
    args.add_argument("-e", "--extensions").help("directory of extension plugins to load");
    args.add_argument("--list-opcodes").help("list every known opcode and exit").default_value(false).implicit_value(true);
    args.add_argument("--verbose").help("report every loaded extension").default_value(false).implicit_value(true);

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

    stkm::prepare_registry(registry, extensions, args.get<bool>("--verbose"));

    if (args.get<bool>("--list-opcodes"))
    {
        fmt::print("{}", stkm::format_opcodes(registry));
        return {};
    }

    auto const file = args.present("--file");

    if (!file.has_value())
    {
        return make_error("no source given, see --help");
    }

    std::filesystem::path const source = *file;
    std::filesystem::path const output = args.present("--output").value_or(stkm::default_output(source).string());

    auto const count = TRY(stkm::compile(registry, source, output));

    fmt::print("Compiled {} instructions from '{}' to '{}'\n", count, source.string(), output.string());

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
