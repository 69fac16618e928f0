#pragma once

#include <functional>
#include <string>
#include "httplib.h"
#include "mockapic/Cancellation.hpp"
#include "mockapic/Duration.hpp"
#include "mockapic/MockRecord.hpp"

namespace mockapic {

// "x-language" -> "X-Language". Names with non-token characters are
// returned unchanged.
std::string canonicalHeaderKey(const std::string& name);

// Renders a stored mock onto an httplib response after the requested delay,
// capped at maxDelay.
class ResponseWriter {
public:
    explicit ResponseWriter(Duration maxDelay) : maxDelay_(maxDelay) {}

    // Empty, unparsable or negative requests resolve to zero.
    Duration effectiveDelay(const std::string& requestedDelay) const;

    // Returns false if the wait was cancelled; `res` is left untouched then.
    bool write(const MockRecord& record,
               const std::string& requestedDelay,
               httplib::Response& res,
               const CancellationSource& cancel,
               const std::function<bool()>& clientGone = {}) const;

    Duration maxDelay() const { return maxDelay_; }

private:
    Duration maxDelay_;
};

} // namespace mockapic
