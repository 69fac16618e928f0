#include "mockapic/Vocabulary.hpp"

#include <algorithm>

namespace mockapic {

const std::vector<std::string>& Vocabulary::contentTypes() {
    static const std::vector<std::string> values = {
        "application/json",
        "application/x-www-form-urlencoded",
        "application/xhtml+xml",
        "application/xml",
        "image/jpeg",
        "image/png",
        "image/svg+xml",
        "multipart/form-data",
        "text/css",
        "text/csv",
        "text/html",
        "text/json",
        "text/plain",
        "text/xml",
    };
    return values;
}

const std::vector<std::string>& Vocabulary::charsets() {
    static const std::vector<std::string> values = {
        "UTF-8",
        "ISO-8859-1",
        "UTF-16",
    };
    return values;
}

const std::map<int, std::string>& Vocabulary::statusCodes() {
    static const std::map<int, std::string> values = {
        {100, "Continue"},
        {101, "Switching Protocols"},
        {102, "Processing"},
        {103, "Early Hints"},

        {200, "OK"},
        {201, "Created"},
        {202, "Accepted"},
        {203, "Non-Authoritative Information"},
        {204, "No Content"},
        {205, "Reset Content"},
        {206, "Partial Content"},
        {207, "Multi-Status"},
        {208, "Already Reported"},
        {226, "IM Used"},

        {300, "Multiple Choices"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {303, "See Other"},
        {304, "Not Modified"},
        {305, "Use Proxy"},
        {307, "Temporary Redirect"},
        {308, "Permanent Redirect"},

        {400, "Bad Request"},
        {401, "Unauthorized"},
        {402, "Payment Required"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {406, "Not Acceptable"},
        {407, "Proxy Authentication Required"},
        {408, "Request Timeout"},
        {409, "Conflict"},
        {410, "Gone"},
        {411, "Length Required"},
        {412, "Precondition Failed"},
        {413, "Request Entity Too Large"},
        {414, "Request URI Too Long"},
        {415, "Unsupported Media Type"},
        {416, "Requested Range Not Satisfiable"},
        {417, "Expectation Failed"},
        {418, "I'm a teapot"},
        {421, "Misdirected Request"},
        {422, "Unprocessable Entity"},
        {423, "Locked"},
        {424, "Failed Dependency"},
        {425, "Too Early"},
        {426, "Upgrade Required"},
        {428, "Precondition Required"},
        {429, "Too Many Requests"},
        {431, "Request Header Fields Too Large"},
        {451, "Unavailable For Legal Reasons"},

        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"},
        {505, "HTTP Version Not Supported"},
        {506, "Variant Also Negotiates"},
        {507, "Insufficient Storage"},
        {508, "Loop Detected"},
        {510, "Not Extended"},
        {511, "Network Authentication Required"},
    };
    return values;
}

bool Vocabulary::isContentType(const std::string& value) {
    const auto& v = contentTypes();
    return std::find(v.begin(), v.end(), value) != v.end();
}

bool Vocabulary::isCharset(const std::string& value) {
    const auto& v = charsets();
    return std::find(v.begin(), v.end(), value) != v.end();
}

bool Vocabulary::isStatusCode(int code) {
    return statusCodes().count(code) > 0;
}

} // namespace mockapic
