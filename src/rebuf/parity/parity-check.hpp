#pragma once

// Abseil
#include <absl/status/statusor.h>

// rebuf
#include <src/rebuf/macros.hpp>
#include <src/rebuf/codec/json-codec.hpp>

// std
#include <string>
#include <cstddef>
#include <ostream>
#include <filesystem>


namespace rebuf {

    struct ParitySettings {
        std::size_t chunkSize = DefaultChunkSize;
        std::size_t readers = DefaultReaders;
        // temporary files go here, system temp directory if empty
        std::filesystem::path scratchDirectory;
    };

    // Outcome of every round trip, true means the record came back unchanged.
    struct ParityReport {
        bool bufferRoundTrip = false;
        bool fileRoundTrip = false;
        bool clearedBufferRoundTrip = false;
        bool concurrentRoundTrip = false;

        bool ok() const;
    };

    std::ostream& operator<<(std::ostream& os, const ParityReport& report);

    // Sample record with a text payload repeated repeat times.
    Record makeSampleRecord(int repeat);

    // Encodes record into a chunked buffer and into a temporary file,
    // decodes both back and compares with the original. Errors are returned
    // only when the check could not run at all.
    absl::StatusOr<ParityReport> runParityCheck(const Record& record, const ParitySettings& settings);

}
