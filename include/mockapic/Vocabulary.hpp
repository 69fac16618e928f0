#pragma once

#include <map>
#include <string>
#include <vector>

namespace mockapic {

// Closed reference sets a mock response must draw from.
class Vocabulary {
public:
    static const std::vector<std::string>& contentTypes();
    static const std::vector<std::string>& charsets();
    // code -> reason phrase
    static const std::map<int, std::string>& statusCodes();

    static bool isContentType(const std::string& value);
    static bool isCharset(const std::string& value);
    static bool isStatusCode(int code);
};

} // namespace mockapic
