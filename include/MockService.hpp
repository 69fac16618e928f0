//MockService.hpp
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "mockapic/MockRecord.hpp"
#include "mockapic/RecordStore.hpp"

namespace mockapic {

// Multi-valued request parameters (query string and form fields).
using RequestParams = std::map<std::string, std::vector<std::string>>;

// Operations the HTTP layer needs. Errors are thrown as mockapic::MockError
// subclasses.
class Mocker {
public:
    virtual ~Mocker() = default;

    virtual MockRecord get(const std::string& id) = 0;
    virtual std::vector<MockRecordSummary> list() = 0;
    // Returns the new mock id.
    virtual std::string create(const RequestParams& params, const std::string& body) = 0;
    // Removes the oldest mocks beyond `maxLimit`; returns how many went.
    virtual int clean(int maxLimit) = 0;
};

class MockService : public Mocker {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit MockService(const std::string& dataDir, Clock clock = {});

    MockRecord get(const std::string& id) override;
    std::vector<MockRecordSummary> list() override;
    std::string create(const RequestParams& params, const std::string& body) override;
    int clean(int maxLimit) override;

    const RecordStore& store() const { return store_; }

private:
    RecordStore store_;
    Clock clock_;

    std::string timestamp() const;
};

// Builds an unsaved record: reserved keys (status, contentType, charset)
// fill typed fields, every other key with a value becomes a header.
MockRecord buildCandidate(const RequestParams& params, const std::string& body);

} // namespace mockapic
