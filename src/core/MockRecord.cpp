#include "mockapic/MockRecord.hpp"

#include "mockapic/Base64.hpp"
#include "mockapic/Errors.hpp"

using json = nlohmann::json;

namespace mockapic {

bool MockRecord::sameResponse(const MockRecord& other) const {
    return status == other.status &&
           contentType == other.contentType &&
           charset == other.charset &&
           headers == other.headers &&
           body == other.body;
}

json toJson(const MockRecord& record) {
    return json{
        {"UUID", record.id},
        {"CreatedAt", record.createdAt},
        {"Status", record.status},
        {"ContentType", record.contentType},
        {"Charset", record.charset},
        {"Headers", record.headers},
        {"Body", base64Encode(record.body)}
    };
}

json toJson(const MockRecordSummary& summary) {
    return json{
        {"UUID", summary.id},
        {"CreatedAt", summary.createdAt},
        {"Status", summary.status},
        {"ContentType", summary.contentType}
    };
}

namespace {

const json& requireField(const json& j, const char* key, json::value_t type) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw CorruptDataError(std::string("missing field ") + key);
    }
    bool ok = it->type() == type ||
              (type == json::value_t::number_integer && it->is_number_unsigned());
    if (!ok) {
        throw CorruptDataError(std::string("field ") + key + " has the wrong type");
    }
    return *it;
}

} // namespace

MockRecordSummary summaryFromJson(const json& j) {
    if (!j.is_object()) throw CorruptDataError("record is not a JSON object");

    MockRecordSummary summary;
    summary.id = requireField(j, "UUID", json::value_t::string).get<std::string>();
    summary.createdAt = requireField(j, "CreatedAt", json::value_t::string).get<std::string>();
    summary.status = requireField(j, "Status", json::value_t::number_integer).get<int>();
    summary.contentType = requireField(j, "ContentType", json::value_t::string).get<std::string>();
    return summary;
}

MockRecord recordFromJson(const json& j) {
    auto summary = summaryFromJson(j);

    MockRecord record;
    record.id = std::move(summary.id);
    record.createdAt = std::move(summary.createdAt);
    record.status = summary.status;
    record.contentType = std::move(summary.contentType);
    record.charset = requireField(j, "Charset", json::value_t::string).get<std::string>();

    // Headers may be null when a record was written with no headers at all.
    auto headers = j.find("Headers");
    if (headers != j.end() && !headers->is_null()) {
        if (!headers->is_object()) throw CorruptDataError("field Headers has the wrong type");
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            if (!it.value().is_string()) {
                throw CorruptDataError("header " + it.key() + " is not a string");
            }
            record.headers[it.key()] = it.value().get<std::string>();
        }
    }

    auto body = j.find("Body");
    if (body != j.end() && !body->is_null()) {
        if (!body->is_string()) throw CorruptDataError("field Body has the wrong type");
        auto decoded = base64Decode(body->get_ref<const std::string&>());
        if (!decoded) throw CorruptDataError("field Body is not valid base64");
        record.body = std::move(*decoded);
    }
    return record;
}

} // namespace mockapic
