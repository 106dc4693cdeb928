#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// nlohmann_json
#include <nlohmann/json.hpp>

// rebuf
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>

// std
#include <memory>
#include <string>
#include <cstdint>
#include <ostream>
#include <filesystem>


namespace rebuf {

    struct SubRecord {
        std::string name;
        std::int64_t value;

        bool operator==(const SubRecord& other) const = default;
    };

    struct Record {
        std::string name;
        std::int64_t value;
        SubRecord sub;

        bool operator==(const Record& other) const = default;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SubRecord, name, value)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Record, name, value, sub)

    std::ostream& operator<<(std::ostream& os, const SubRecord& record);
    std::ostream& operator<<(std::ostream& os, const Record& record);

    // Serializes json text through cursor, starting at its position.
    absl::Status encode(const nlohmann::json& value, std::shared_ptr<WriteCursor> cursor);
    // Parses json text from cursor position up to the end of buffer.
    absl::StatusOr<nlohmann::json> decode(std::shared_ptr<ReadCursor> cursor);
    absl::StatusOr<Record> decodeRecord(std::shared_ptr<ReadCursor> cursor);

    // same contract, backed by a regular file
    absl::Status encodeToFile(const nlohmann::json& value, const std::filesystem::path& path);
    absl::StatusOr<nlohmann::json> decodeFromFile(const std::filesystem::path& path);
    absl::StatusOr<Record> decodeRecordFromFile(const std::filesystem::path& path);

}
