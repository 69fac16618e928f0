#include "mockapic/RecordStore.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include "mockapic/Errors.hpp"
#include "mockapic/Uuid.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace mockapic {

namespace {

constexpr const char* kRecordExtension = ".json";

bool readFile(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

} // namespace

RecordStore::RecordStore(const std::string& dataDir) : dataDir_(dataDir) {
    fs::create_directories(dataDir_);
}

fs::path RecordStore::pathFor(const std::string& id) const {
    parseUUID(id); // rejects anything that is not a canonical UUID
    return fs::path(dataDir_) / (id + kRecordExtension);
}

MockRecord RecordStore::get(const std::string& id) const {
    auto path = pathFor(id);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw NotFoundError("mock " + id + " does not exist");
    }

    std::string data;
    if (!readFile(path, data)) {
        // removed between the check and the read
        std::cerr << "RecordStore: failed to read " << path.string() << "\n";
        throw NotFoundError("mock " + id + " does not exist");
    }

    auto j = json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "RecordStore: invalid JSON for mockId=" << id
                  << " dataDir=" << dataDir_ << "\n";
        throw CorruptDataError("mock " + id + " is not valid JSON");
    }

    try {
        return recordFromJson(j);
    } catch (const CorruptDataError& e) {
        std::cerr << "RecordStore: corrupt record mockId=" << id
                  << " dataDir=" << dataDir_ << ": " << e.what() << "\n";
        throw CorruptDataError("mock " + id + ": " + e.what());
    }
}

std::optional<MockRecordSummary> RecordStore::loadSummary(const fs::path& path) const {
    std::string data;
    if (!readFile(path, data)) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) return std::nullopt; // removed since the scan
        throw CorruptDataError("cannot read " + path.filename().string());
    }

    // Drop the body while parsing; a summary never needs it.
    json::parser_callback_t skipBody = [](int depth, json::parse_event_t event, json& parsed) {
        return !(depth == 1 && event == json::parse_event_t::key && parsed == json("Body"));
    };

    auto j = json::parse(data, skipBody, false);
    if (j.is_discarded()) {
        throw CorruptDataError(path.filename().string() + " is not valid JSON");
    }

    auto summary = summaryFromJson(j);
    if (summary.id != path.stem().string()) {
        throw CorruptDataError(path.filename().string() + " holds mock " + summary.id);
    }
    return summary;
}

std::vector<MockRecordSummary> RecordStore::list() const {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(dataDir_, ec);
    if (ec) {
        std::cerr << "RecordStore: failed to read directory " << dataDir_
                  << ": " << ec.message() << "\n";
        throw ListError("cannot read " + dataDir_ + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) continue;
        if (it->path().extension() != kRecordExtension) continue;
        files.push_back(it->path());
    }
    if (ec) {
        std::cerr << "RecordStore: directory scan failed in " << dataDir_
                  << ": " << ec.message() << "\n";
        throw ListError("cannot read " + dataDir_ + ": " + ec.message());
    }

    // Directory order is unspecified; fix it so ties in createdAt are stable.
    std::sort(files.begin(), files.end());

    std::vector<MockRecordSummary> summaries;
    summaries.reserve(files.size());
    for (const auto& path : files) {
        try {
            if (auto summary = loadSummary(path)) summaries.push_back(std::move(*summary));
        } catch (const CorruptDataError& e) {
            std::cerr << "RecordStore: list aborted on " << path.string()
                      << ": " << e.what() << "\n";
            throw ListError(std::string("error to list mocked responses: ") + e.what());
        }
    }

    std::stable_sort(summaries.begin(), summaries.end(),
        [](const MockRecordSummary& a, const MockRecordSummary& b) {
            return a.createdAt > b.createdAt;
        });
    return summaries;
}

void RecordStore::put(const MockRecord& record) {
    auto path = pathFor(record.id);
    auto tmpPath = path;
    tmpPath += ".tmp";

    std::string payload = toJson(record).dump();
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "RecordStore: failed to open " << tmpPath.string() << "\n";
            throw WriteError("cannot write mock " + record.id);
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            std::cerr << "RecordStore: write failed for " << tmpPath.string() << "\n";
            out.close();
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw WriteError("cannot write mock " + record.id);
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::cerr << "RecordStore: failed to move " << tmpPath.string()
                  << " into place: " << ec.message() << "\n";
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw WriteError("cannot write mock " + record.id + ": " + ec.message());
    }
}

bool RecordStore::remove(const std::string& id) {
    auto path = pathFor(id);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        std::cerr << "RecordStore: failed to remove " << path.string()
                  << ": " << ec.message() << "\n";
        return false;
    }
    return removed;
}

} // namespace mockapic
