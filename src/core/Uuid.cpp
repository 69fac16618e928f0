#include "mockapic/Uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#include "mockapic/Errors.hpp"

namespace mockapic {

UUID generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    UUID id{};
    for (size_t i = 0; i < id.size(); i += 8) {
        uint64_t v = rng();
        for (size_t k = 0; k < 8; ++k) {
            id[i + k] = static_cast<uint8_t>(v >> (k * 8));
        }
    }

    // RFC4122 variant + version 4
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    return id;
}

std::string newUUIDString() {
    return toString(generateUUID());
}

std::string toString(const UUID& id) {
    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(id[i]);
    }
    return oss.str();
}

UUID parseUUID(const std::string& text) {
    if (text.size() != 36) {
        throw InvalidIdError("invalid UUID length: " + std::to_string(text.size()));
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    UUID id{};
    size_t byte = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') throw InvalidIdError("invalid UUID format");
            ++i;
            continue;
        }
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) throw InvalidIdError("invalid UUID format");
        id[byte++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

} // namespace mockapic
