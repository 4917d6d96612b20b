// src/voyage/journey/Journey.cpp
#include "voyage/journey/Journey.hpp"
#include "voyage/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace voyage::journey {

const char* ToKey(DisplayMode m) noexcept
{
    return m == DisplayMode::Detailed ? "detailed" : "simple";
}

DisplayMode ParseDisplayMode(std::string_view text)
{
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "simple")   return DisplayMode::Simple;
    if (s == "detailed") return DisplayMode::Detailed;
    throw ConfigurationError("unknown display mode '" + std::string(text) + "' (expected simple or detailed)");
}

void ValidateStageDuration(int days)
{
    if (days < kMinStageDays || days > kMaxStageDays)
        throw ConfigurationError("stage duration " + std::to_string(days) + " is outside " +
                                 std::to_string(kMinStageDays) + "-" + std::to_string(kMaxStageDays));
}

} // namespace voyage::journey
