#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stkm {

size_t edit_distance(std::string_view a, std::string_view b);

// 1.0 for identical words, 0.0 for words sharing nothing
double similarity(std::string_view a, std::string_view b);

std::vector<std::string> closest_matches(std::string_view word, std::span<std::string const> candidates, size_t count = 3, double cutoff = 0.6);

} // stkm
