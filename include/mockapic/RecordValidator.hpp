#pragma once

#include "mockapic/MockRecord.hpp"

namespace mockapic {

// Checks status, content type and charset (in that order) against the
// reference vocabularies. Throws ValidationError naming the first bad field.
class RecordValidator {
public:
    static void validate(const MockRecord& candidate);
};

} // namespace mockapic
