// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

// boost
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// Plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <ostream>
#include <filesystem>
#include <system_error>
#include <cstdint>

// posix
#include <unistd.h>

// rebuf
#include <src/common/exceptions.hpp>
#include <src/rebuf/codec/json-codec.hpp>
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

// local
#include "parity-check.hpp"

using namespace rebuf;

namespace {

    std::atomic<std::uint64_t> GScratchCounter = 0;

    // Writes record through a fresh write cursor and reads it back
    // through a fresh read cursor.
    absl::StatusOr<bool> bufferRoundTrip(const std::shared_ptr<ChunkedBuffer>& buffer, const Record& record) {
        auto writer = buffer->outputStream();
        if (auto status = encode(record, writer); !status.ok()) {
            return status;
        }
        writer->close();

        auto reader = buffer->inputStream();
        auto decoded = decodeRecord(reader);
        reader->close();
        if (!decoded.ok()) {
            PLOG(plog::error) << "record was not decoded from buffer: " << decoded.status().message();
            return false;
        }

        return *decoded == record;
    }

    absl::StatusOr<bool> fileRoundTrip(const std::filesystem::path& directory, const Record& record) {
        auto path = directory / absl::StrCat("rebuf-parity-", ::getpid(), "-", GScratchCounter++, ".json");
        if (auto status = encodeToFile(record, path); !status.ok()) {
            return status;
        }

        auto decoded = decodeRecordFromFile(path);

        std::error_code error;
        std::filesystem::remove(path, error);
        if (error) {
            PLOG(plog::warning) << "temporary file was not removed: " << path.string() << "; " << error.message();
        }

        if (!decoded.ok()) {
            PLOG(plog::error) << "record was not decoded from file: " << decoded.status().message();
            return false;
        }

        return *decoded == record;
    }

    // Every reader decodes the same buffer through its own cursor.
    bool concurrentRoundTrip(const std::shared_ptr<ChunkedBuffer>& buffer, const Record& record, std::size_t readers) {
        std::vector<absl::StatusOr<Record>> results(readers, absl::UnknownError("reader did not run"));
        {
            boost::asio::thread_pool pool(readers);
            for (std::size_t reader = 0; reader < readers; ++reader) {
                boost::asio::post(pool, [&buffer, &results, reader]() {
                    try {
                        results[reader] = decodeRecord(buffer->inputStream());
                    } catch (const RebufClosed& error) {
                        results[reader] = absl::FailedPreconditionError(error.what());
                    }
                });
            }
            pool.join();
        }

        bool matches = true;
        for (std::size_t reader = 0; reader < readers; ++reader) {
            if (!results[reader].ok()) {
                PLOG(plog::error) << "reader " << reader << " failed: " << results[reader].status().message();
                matches = false;
            } else if (*results[reader] != record) {
                PLOG(plog::error) << "reader " << reader << " decoded different record: " << *results[reader];
                matches = false;
            }
        }

        return matches;
    }

}

bool ParityReport::ok() const {
    return bufferRoundTrip && fileRoundTrip && clearedBufferRoundTrip && concurrentRoundTrip;
}

std::ostream& rebuf::operator<<(std::ostream& os, const ParityReport& report) {
    return os << std::boolalpha
        << "buffer: " << report.bufferRoundTrip << '\n'
        << "file: " << report.fileRoundTrip << '\n'
        << "cleared buffer: " << report.clearedBufferRoundTrip << '\n'
        << "concurrent readers: " << report.concurrentRoundTrip << '\n';
}

Record rebuf::makeSampleRecord(int repeat) {
    Record record {
        .name = {},
        .value = 110234,
        .sub = SubRecord {
            .name = "Sub",
            .value = 1234
        }
    };

    for (int i = 0; i < repeat; ++i) {
        record.name += "Hello,World";
    }

    return record;
}

absl::StatusOr<ParityReport> rebuf::runParityCheck(const Record& record, const ParitySettings& settings) {
    if (settings.readers == 0) {
        return absl::InvalidArgumentError("at least one reader is required");
    }

    std::filesystem::path scratch = settings.scratchDirectory;
    if (scratch.empty()) {
        std::error_code error;
        scratch = std::filesystem::temp_directory_path(error);
        if (error) {
            return absl::InternalError(absl::StrCat("no temporary directory available: ", error.message()));
        }
    }

    ParityReport report;
    std::shared_ptr<ChunkedBuffer> buffer;
    try {
        buffer = ChunkedBuffer::configure({.chunkSize = settings.chunkSize});
    } catch (const RebufInvalidArgument& error) {
        return absl::InvalidArgumentError(error.what());
    }

    auto result = bufferRoundTrip(buffer, record);
    if (!result.ok()) {
        return result.status();
    }
    report.bufferRoundTrip = *result;
    PLOG(plog::info) << "buffer round trip: " << report.bufferRoundTrip
        << "; used " << buffer->size() << " of " << buffer->allocatedSize() << " bytes";

    result = fileRoundTrip(scratch, record);
    if (!result.ok()) {
        return result.status();
    }
    report.fileRoundTrip = *result;
    PLOG(plog::info) << "file round trip: " << report.fileRoundTrip;

    buffer->clear();
    result = bufferRoundTrip(buffer, record);
    if (!result.ok()) {
        return result.status();
    }
    report.clearedBufferRoundTrip = *result;
    PLOG(plog::info) << "cleared buffer round trip: " << report.clearedBufferRoundTrip;

    report.concurrentRoundTrip = concurrentRoundTrip(buffer, record, settings.readers);
    PLOG(plog::info) << "concurrent round trip with " << settings.readers << " readers: " << report.concurrentRoundTrip;

    buffer->close();
    return report;
}
