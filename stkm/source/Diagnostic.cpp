#include "stkm/Diagnostic.hpp"

#include <fmt/color.h>

namespace stkm {

void report_error(std::string_view message, FILE* file)
{
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
    fmt::print(file, "{}\n", message);
}

void report_warning(std::string_view message, FILE* file)
{
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::yellow), "warning: ");
    fmt::print(file, "{}\n", message);
}

void report_info(std::string_view message, FILE* file)
{
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
    fmt::print(file, "{}\n", message);
}

void report_extensions(LoadReport const& report, bool verbose, FILE* file)
{
    if (verbose)
    {
        for (auto const& name : report.loaded)
        {
            report_info(fmt::format("loaded extension {}", name), file);
        }
    }

    for (auto const& [source, reason] : report.rejected)
    {
        report_warning(fmt::format("{}: {}", source, reason), file);
    }
}

} // stkm
