#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace mockapic {

// A canned HTTP response, immutable once stored.
struct MockRecord {
    std::string id;
    std::string createdAt; // "YYYY-MM-DD HH:MM:SS", UTC
    int status = 0;
    std::string contentType;
    std::string charset;
    std::map<std::string, std::string> headers;
    std::string body;      // raw bytes

    // Same response content; id and createdAt are ignored.
    bool sameResponse(const MockRecord& other) const;
};

// Projection used by List so the body is never loaded.
struct MockRecordSummary {
    std::string id;
    std::string createdAt;
    int status = 0;
    std::string contentType;
};

// On-disk / wire form. Keys: UUID, CreatedAt, Status, ContentType, Charset,
// Headers, Body (base64).
nlohmann::json toJson(const MockRecord& record);
nlohmann::json toJson(const MockRecordSummary& summary);

// Both throw CorruptDataError on missing or mistyped fields.
MockRecord recordFromJson(const nlohmann::json& j);
MockRecordSummary summaryFromJson(const nlohmann::json& j);

} // namespace mockapic
