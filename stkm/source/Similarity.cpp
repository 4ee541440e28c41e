#include "stkm/Similarity.hpp"

#include <algorithm>
#include <ranges>

namespace stkm {

size_t edit_distance(std::string_view a, std::string_view b)
{
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);

    for (size_t j = 0; j <= b.size(); ++j) previous[j] = j;

    for (size_t i = 1; i <= a.size(); ++i)
    {
        current[0] = i;

        for (size_t j = 1; j <= b.size(); ++j)
        {
            size_t const cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            current[j] = std::min({ previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost });
        }

        previous.swap(current);
    }

    return previous[b.size()];
}

double similarity(std::string_view a, std::string_view b)
{
    auto const longest = std::max(a.size(), b.size());

    if (longest == 0)
    {
        return 1.0;
    }

    return 1.0 - static_cast<double>(edit_distance(a, b)) / static_cast<double>(longest);
}

std::vector<std::string> closest_matches(std::string_view word, std::span<std::string const> candidates, size_t count, double cutoff)
{
    std::vector<std::pair<double, std::string>> scored;

    for (auto const& candidate : candidates)
    {
        if (auto score = similarity(word, candidate); score >= cutoff)
        {
            scored.emplace_back(score, candidate);
        }
    }

    std::ranges::sort(scored, [] (auto const& lhs, auto const& rhs) {
        return lhs.first != rhs.first ? lhs.first > rhs.first : lhs.second < rhs.second;
    });

    std::vector<std::string> matches;

    for (auto& [score, candidate] : scored | std::views::take(count))
    {
        matches.push_back(std::move(candidate));
    }

    return matches;
}

} // stkm
