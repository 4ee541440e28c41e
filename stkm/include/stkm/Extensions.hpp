#pragma once

#include "stkm/Registry.hpp"

#include <liberror/Result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace stkm {

// symbol every extension plugin exports, with the signature of ExtensionEntryPoint
static constexpr auto EXTENSION_ENTRY_POINT = "stkm_extensions";

// file suffix of loadable plugins on this platform
static constexpr auto EXTENSION_SUFFIX = STKM_MODULE_SUFFIX;

using ExtensionEntryPoint = void (*)(std::vector<Extension>& extensions);

// MOD, NEG, the comparisons and the DEPTH/OVER/ROT/PEEK stack helpers
std::vector<Extension> standard_extensions();

struct Rejection
{
    std::string source;
    std::string reason;
};

struct LoadReport
{
    std::vector<std::string> loaded;
    std::vector<Rejection> rejected;
};

// registers in name order; conflicts are reported, never overwritten
LoadReport register_extensions(Registry& registry, std::vector<Extension> extensions, std::string const& source);

LoadReport register_standard_extensions(Registry& registry);

//
// Loads every shared library in `directory`, in filename order, and registers
// the extensions each one declares through its stkm_extensions entry point.
// A library that cannot be loaded only rejects its own extensions.
//
LoadReport load_extensions(Registry& registry, std::filesystem::path const& directory);

} // stkm
