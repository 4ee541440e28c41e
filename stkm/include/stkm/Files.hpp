#pragma once

#include <liberror/Result.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stkm {

liberror::Result<std::string> read_text(std::filesystem::path const& path);
liberror::Result<std::vector<uint8_t>> read_bytes(std::filesystem::path const& path);

// writes next to the destination first and renames over it, so a failure
// never leaves a partially written file behind
liberror::Result<void> write_file(std::filesystem::path const& path, std::span<uint8_t const> contents);
liberror::Result<void> write_file(std::filesystem::path const& path, std::string_view contents);

} // stkm
