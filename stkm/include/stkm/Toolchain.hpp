#pragma once

#include "stkm/Constructs.hpp"
#include "stkm/Machine.hpp"
#include "stkm/Registry.hpp"

#include <liberror/Result.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace stkm {

// base set, standard extensions, then any plugins found in `extensions`
void prepare_registry(Registry& registry, std::optional<std::filesystem::path> const& extensions, bool verbose);

std::filesystem::path default_output(std::filesystem::path const& source);

// assembles `source` and writes its bytecode to `output`, returning the instruction count
liberror::Result<size_t> compile(Registry const& registry, std::filesystem::path const& source, std::filesystem::path const& output);

liberror::Result<Program> load_bytecode(Registry const& registry, std::filesystem::path const& bytecode);

std::string format_snapshot(Snapshot const& snapshot);

std::string format_opcodes(Registry const& registry);

} // stkm
