#pragma once

#include <mutex>
#include <optional>
#include "MockService.hpp"
#include "mockapic/Errors.hpp"
#include "mockapic/RecordValidator.hpp"

// In-memory Mocker for exercising the HTTP layer without a store.
class FakeMocker : public mockapic::Mocker {
public:
    std::optional<mockapic::MockRecord> record;
    std::optional<std::vector<mockapic::MockRecordSummary>> summaries;
    std::string nextId = "6f1c2a3b-4d5e-4f60-8a7b-9c0d1e2f3a4b";
    int cleanCalls = 0;
    int lastCleanLimit = 0;

    mockapic::MockRecord get(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!record) throw mockapic::NotFoundError("mock " + id + " does not exist");
        return *record;
    }

    std::vector<mockapic::MockRecordSummary> list() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!summaries) throw mockapic::ListError("error to list mocked responses");
        return *summaries;
    }

    std::string create(const mockapic::RequestParams& params, const std::string& body) override {
        auto candidate = mockapic::buildCandidate(params, body);
        mockapic::RecordValidator::validate(candidate);
        std::lock_guard<std::mutex> lock(mutex_);
        candidate.id = nextId;
        record = candidate;
        return nextId;
    }

    int clean(int maxLimit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cleanCalls;
        lastCleanLimit = maxLimit;
        return 0;
    }

    void setRecord(std::optional<mockapic::MockRecord> r) {
        std::lock_guard<std::mutex> lock(mutex_);
        record = std::move(r);
    }

    void setSummaries(std::optional<std::vector<mockapic::MockRecordSummary>> s) {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries = std::move(s);
    }

    std::optional<mockapic::MockRecord> storedRecord() {
        std::lock_guard<std::mutex> lock(mutex_);
        return record;
    }

    int cleanCallCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cleanCalls;
    }

    int cleanLimitSeen() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastCleanLimit;
    }

private:
    std::mutex mutex_;
};
