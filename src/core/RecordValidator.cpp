#include "mockapic/RecordValidator.hpp"

#include "mockapic/Errors.hpp"
#include "mockapic/Vocabulary.hpp"

namespace mockapic {

void RecordValidator::validate(const MockRecord& candidate) {
    if (!Vocabulary::isStatusCode(candidate.status)) {
        throw ValidationError("status", std::to_string(candidate.status));
    }
    if (!Vocabulary::isContentType(candidate.contentType)) {
        throw ValidationError("contentType", candidate.contentType);
    }
    if (!Vocabulary::isCharset(candidate.charset)) {
        throw ValidationError("charset", candidate.charset);
    }
}

} // namespace mockapic
