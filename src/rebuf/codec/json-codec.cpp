// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

// nlohmann_json
#include <nlohmann/json.hpp>

// Plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <memory>
#include <string>
#include <fstream>
#include <istream>
#include <ostream>
#include <filesystem>

// rebuf
#include <src/common/exceptions.hpp>
#include <src/rebuf/stream/cursor-streambuf.hpp>

// local
#include "json-codec.hpp"

using namespace rebuf;

namespace {

    absl::StatusOr<Record> toRecord(absl::StatusOr<nlohmann::json> value) {
        if (!value.ok()) {
            return value.status();
        }

        try {
            return value->get<Record>();
        } catch (const nlohmann::json::exception& error) {
            return absl::InvalidArgumentError(absl::StrCat("json does not describe a record: ", error.what()));
        }
    }

}

std::ostream& rebuf::operator<<(std::ostream& os, const SubRecord& record) {
    return os << "(name:" << record.name << " value:" << record.value << ")";
}

std::ostream& rebuf::operator<<(std::ostream& os, const Record& record) {
    return os << "(name:" << record.name << " value:" << record.value << " sub:" << record.sub << ")";
}

absl::Status rebuf::encode(const nlohmann::json& value, std::shared_ptr<WriteCursor> cursor) {
    try {
        WriteCursorStreamBuf streamBuf(std::move(cursor));
        std::ostream os(&streamBuf);
        // rethrow cursor errors instead of swallowing them into badbit
        os.exceptions(std::ios::badbit);

        os << value.dump();
        os.flush();
    } catch (const RebufClosed& error) {
        return absl::FailedPreconditionError(error.what());
    } catch (const RebufInvalidArgument& error) {
        return absl::InvalidArgumentError(error.what());
    } catch (const std::ios_base::failure& error) {
        return absl::InternalError(absl::StrCat("error while writing json: ", error.what()));
    }

    return absl::OkStatus();
}

absl::StatusOr<nlohmann::json> rebuf::decode(std::shared_ptr<ReadCursor> cursor) {
    nlohmann::json value;
    try {
        ReadCursorStreamBuf streamBuf(std::move(cursor));
        std::istream is(&streamBuf);
        is.exceptions(std::ios::badbit);

        value = nlohmann::json::parse(is, nullptr, false);
    } catch (const RebufClosed& error) {
        return absl::FailedPreconditionError(error.what());
    } catch (const RebufInvalidArgument& error) {
        return absl::InvalidArgumentError(error.what());
    } catch (const std::ios_base::failure& error) {
        return absl::InternalError(absl::StrCat("error while reading json: ", error.what()));
    }

    if (value.is_discarded()) {
        PLOG(plog::debug) << "buffer content is not a valid json";
        return absl::InvalidArgumentError("error while parsing json, buffer content is malformed");
    }

    return value;
}

absl::StatusOr<Record> rebuf::decodeRecord(std::shared_ptr<ReadCursor> cursor) {
    return toRecord(decode(std::move(cursor)));
}

absl::Status rebuf::encodeToFile(const nlohmann::json& value, const std::filesystem::path& path) {
    std::ofstream ofs {path, std::ios::out | std::ios::binary | std::ios::trunc};
    if (!ofs) {
        return absl::InternalError(absl::StrCat("error while opening file for writing: ", path.string()));
    }

    std::string dumped = value.dump();
    if (!ofs.write(dumped.data(), dumped.size())) {
        return absl::InternalError(absl::StrCat("error while writing file: ", path.string()));
    }

    return absl::OkStatus();
}

absl::StatusOr<nlohmann::json> rebuf::decodeFromFile(const std::filesystem::path& path) {
    std::ifstream ifs {path, std::ios::in | std::ios::binary};
    if (!ifs) {
        return absl::NotFoundError(absl::StrCat("error while opening file: ", path.string(), ", ensure that it exists"));
    }

    nlohmann::json value = nlohmann::json::parse(ifs, nullptr, false);
    if (value.is_discarded()) {
        return absl::InvalidArgumentError(absl::StrCat("error while parsing json from file: ", path.string()));
    }

    return value;
}

absl::StatusOr<Record> rebuf::decodeRecordFromFile(const std::filesystem::path& path) {
    return toRecord(decodeFromFile(path));
}
