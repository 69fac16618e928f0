#include "MockService.hpp"

#include <ctime>
#include <iostream>

#include "mockapic/Errors.hpp"
#include "mockapic/RecordValidator.hpp"
#include "mockapic/Uuid.hpp"

namespace mockapic {

namespace {

int parseStatus(const std::string& value) {
    if (value.empty()) return -1;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        return used == value.size() ? v : -1;
    } catch (const std::exception&) {
        return -1;
    }
}

const std::string& firstValue(const std::vector<std::string>& values) {
    static const std::string empty;
    return values.empty() ? empty : values.front();
}

} // namespace

MockRecord buildCandidate(const RequestParams& params, const std::string& body) {
    MockRecord record;
    record.status = -1;
    record.body = body;

    for (const auto& kv : params) {
        const auto& name = kv.first;
        if (name == "status") {
            record.status = parseStatus(firstValue(kv.second));
        } else if (name == "contentType") {
            record.contentType = firstValue(kv.second);
        } else if (name == "charset") {
            record.charset = firstValue(kv.second);
        } else if (!kv.second.empty()) {
            record.headers[name] = kv.second.front();
        }
    }
    return record;
}

MockService::MockService(const std::string& dataDir, Clock clock)
    : store_(dataDir), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

std::string MockService::timestamp() const {
    std::time_t t = std::chrono::system_clock::to_time_t(clock_());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

MockRecord MockService::get(const std::string& id) {
    return store_.get(id);
}

std::vector<MockRecordSummary> MockService::list() {
    return store_.list();
}

std::string MockService::create(const RequestParams& params, const std::string& body) {
    MockRecord record = buildCandidate(params, body);
    RecordValidator::validate(record);

    record.id = newUUIDString();
    record.createdAt = timestamp();
    store_.put(record);
    return record.id;
}

int MockService::clean(int maxLimit) {
    if (maxLimit < 1) return 0;

    auto summaries = store_.list();
    if (summaries.size() <= static_cast<size_t>(maxLimit)) return 0;

    int removed = 0;
    for (size_t i = static_cast<size_t>(maxLimit); i < summaries.size(); ++i) {
        try {
            if (store_.remove(summaries[i].id)) ++removed;
        } catch (const MockError& e) {
            std::cerr << "MockService: cannot remove " << summaries[i].id
                      << ": " << e.what() << "\n";
        }
    }
    return removed;
}

} // namespace mockapic
