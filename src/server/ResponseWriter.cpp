#include "mockapic/ResponseWriter.hpp"

#include <algorithm>
#include <cctype>

namespace mockapic {

namespace {

bool isTokenChar(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string canonicalHeaderKey(const std::string& name) {
    for (unsigned char c : name) {
        if (!isTokenChar(c)) return name;
    }

    std::string out = name;
    bool upper = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        ch = static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
        upper = ch == '-';
    }
    return out;
}

Duration ResponseWriter::effectiveDelay(const std::string& requestedDelay) const {
    if (requestedDelay.empty()) return Duration::zero();
    auto requested = parseDuration(requestedDelay);
    if (!requested || *requested <= Duration::zero()) return Duration::zero();
    return std::min(*requested, maxDelay_);
}

bool ResponseWriter::write(const MockRecord& record,
                           const std::string& requestedDelay,
                           httplib::Response& res,
                           const CancellationSource& cancel,
                           const std::function<bool()>& clientGone) const {
    auto delay = effectiveDelay(requestedDelay);
    if (delay > Duration::zero() && !cancel.waitFor(delay, clientGone)) {
        return false;
    }

    res.status = record.status;
    res.set_header("Content-Type", record.contentType + "; charset=" + record.charset);
    for (const auto& kv : record.headers) {
        auto key = canonicalHeaderKey(kv.first);
        res.headers.erase(key);
        res.set_header(key, kv.second);
    }
    res.body = record.body;
    return true;
}

} // namespace mockapic
