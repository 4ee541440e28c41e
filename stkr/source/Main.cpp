#include <stkm/Diagnostic.hpp>
#include <stkm/Machine.hpp>
#include <stkm/Registry.hpp>
#include <stkm/Toolchain.hpp>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <liberror/Result.hpp>
#include <liberror/Try.hpp>

#include <signal.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <string>

using namespace liberror;

namespace {

volatile sig_atomic_t interrupted = 0;

void on_interrupt(int)
{
    interrupted = 1;
}

// no SA_RESTART, so a pending read in step mode fails instead of resuming
void catch_interrupts()
{
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

bool wait_for_continue()
{
    fmt::print(stderr, "Press Enter to continue (q or Ctrl+C to exit)...");

    std::string line;

    if (!std::getline(std::cin, line) || interrupted != 0)
    {
        return false;
    }

    return line != "q";
}

void trace(stkm::Machine& machine, bool step)
{
    catch_interrupts();

    for (auto const& snapshot : machine.trace())
    {
        fmt::print("{}\n", stkm::format_snapshot(snapshot));
        std::fflush(stdout);

        if (interrupted != 0 || (step && !wait_for_continue()))
        {
            machine.interrupt();
            stkm::report_info("execution interrupted by user");
            break;
        }
    }
}

}

Result<void> safe_main(std::span<char const*> arguments)
{
    argparse::ArgumentParser args("stkr", "", argparse::default_arguments::help);
    args.add_description("stkm virtual machine");

    args.add_argument("-f", "--file").help("bytecode to be executed");
    args.add_argument("-e", "--extensions").help("directory of extension plugins to load");
    args.add_argument("--trace").help("print the machine state before every instruction").default_value(false).implicit_value(true);
    args.add_argument("--step").help("trace, pausing for Enter before every instruction").default_value(false).implicit_value(true);
    args.add_argument("--stats").help("print instruction and cycle counts after the run").default_value(false).implicit_value(true);
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
        return make_error("no bytecode given, see --help");
    }

    auto program = TRY(stkm::load_bytecode(registry, *file));

    stkm::Machine machine(registry);
    machine.load(std::move(program));

    auto const step = args.get<bool>("--step");

    if (step || args.get<bool>("--trace"))
    {
        trace(machine, step);
        TRY(machine.fault());
    }
    else
    {
        TRY(machine.execute());
    }

    if (args.get<bool>("--stats"))
    {
        auto const [instructions, cycles] = machine.statistics();
        fmt::print("Instructions: {}\nCycles: {}\n", instructions, cycles);
    }

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
