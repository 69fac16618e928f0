#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "mockapic/MockRecord.hpp"

namespace mockapic {

// One JSON file per mock record, named <id>.json, inside a working
// directory. No caching: every call goes to disk.
class RecordStore {
public:
    explicit RecordStore(const std::string& dataDir);

    // Throws InvalidIdError, NotFoundError or CorruptDataError.
    MockRecord get(const std::string& id) const;

    // Newest first. Records removed while the directory is being scanned are
    // left out. Throws ListError if the directory cannot be read or any
    // remaining record is corrupt.
    std::vector<MockRecordSummary> list() const;

    // Writes through a temporary file renamed into place. Throws WriteError.
    void put(const MockRecord& record);

    // Returns true if a record file was removed.
    bool remove(const std::string& id);

    const std::string& dataDir() const { return dataDir_; }

private:
    std::string dataDir_;

    std::filesystem::path pathFor(const std::string& id) const;
    std::optional<MockRecordSummary> loadSummary(const std::filesystem::path& path) const;
};

} // namespace mockapic
