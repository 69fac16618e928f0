#include "mockapic/Duration.hpp"

#include <cstdint>
#include <limits>
#include <sstream>

namespace mockapic {

namespace {

// Nanoseconds per unit, 0 if the unit is unknown.
int64_t unitScale(std::string_view unit) {
    if (unit == "ns") return 1;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1000; // us, µs
    if (unit == "ms") return 1000 * 1000;
    if (unit == "s") return 1000LL * 1000 * 1000;
    if (unit == "m") return 60LL * 1000 * 1000 * 1000;
    if (unit == "h") return 3600LL * 1000 * 1000 * 1000;
    return 0;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

std::optional<Duration> parseDuration(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }
    if (text == "0") return Duration::zero();
    if (text.empty()) return std::nullopt;

    const long double limit = static_cast<long double>(std::numeric_limits<int64_t>::max());
    long double total = 0;

    size_t i = 0;
    while (i < text.size()) {
        long double whole = 0;
        size_t start = i;
        while (i < text.size() && isDigit(text[i])) {
            whole = whole * 10 + (text[i] - '0');
            ++i;
        }
        bool hasWhole = i > start;

        long double frac = 0;
        long double fracScale = 1;
        bool hasFrac = false;
        if (i < text.size() && text[i] == '.') {
            ++i;
            size_t fracStart = i;
            while (i < text.size() && isDigit(text[i])) {
                frac = frac * 10 + (text[i] - '0');
                fracScale *= 10;
                ++i;
            }
            hasFrac = i > fracStart;
        }
        if (!hasWhole && !hasFrac) return std::nullopt;

        size_t unitStart = i;
        while (i < text.size() && text[i] != '.' && !isDigit(text[i])) ++i;
        if (i == unitStart) return std::nullopt; // missing unit

        int64_t scale = unitScale(text.substr(unitStart, i - unitStart));
        if (scale == 0) return std::nullopt;

        total += whole * scale + frac * scale / fracScale;
        if (total > limit) return std::nullopt;
    }

    auto ns = static_cast<int64_t>(total);
    return Duration(negative ? -ns : ns);
}

std::string formatDuration(Duration d) {
    using namespace std::chrono;

    if (d == Duration::zero()) return "0s";

    std::ostringstream out;
    if (d < Duration::zero()) {
        out << "-";
        d = -d;
    }
    if (d < milliseconds(1)) {
        if (d < microseconds(1)) {
            out << d.count() << "ns";
        } else {
            out << duration_cast<duration<double, std::micro>>(d).count() << "us";
        }
        return out.str();
    }
    if (d < seconds(1)) {
        out << duration_cast<duration<double, std::milli>>(d).count() << "ms";
        return out.str();
    }

    auto h = duration_cast<hours>(d);
    d -= h;
    auto m = duration_cast<minutes>(d);
    d -= m;
    if (h.count() > 0) out << h.count() << "h";
    if (h.count() > 0 || m.count() > 0) out << m.count() << "m";
    out << duration_cast<duration<double>>(d).count() << "s";
    return out.str();
}

} // namespace mockapic
