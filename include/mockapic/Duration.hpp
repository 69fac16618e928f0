#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mockapic {

using Duration = std::chrono::nanoseconds;

// Parses "300ms", "1.5s", "1m30s", "2h". Units: ns, us, µs, ms, s, m, h.
// A leading '-' or '+' is accepted; a bare "0" needs no unit.
// Returns nullopt for anything else, including an empty string.
std::optional<Duration> parseDuration(std::string_view text);

// Shortest "1m30s" style rendering, used in logs and usage text.
std::string formatDuration(Duration d);

} // namespace mockapic
