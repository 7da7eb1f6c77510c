/// @file src/core/types.cpp
/// @brief GroupingKey string conversions.

#include "ridership/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ridership {

const char* to_string(GroupingKey key) noexcept {
    switch (key) {
        case GroupingKey::Station: return "station";
        case GroupingKey::Complex: return "complex";
    }
    return "unknown";
}

std::optional<GroupingKey> parse_grouping_key(std::string_view text) noexcept {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "station") return GroupingKey::Station;
    if (lowered == "complex") return GroupingKey::Complex;
    return std::nullopt;
}

}  // namespace ridership
