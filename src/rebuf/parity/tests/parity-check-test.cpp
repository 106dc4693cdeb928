// GTest
#include <gtest/gtest.h>

// Abseil
#include <absl/status/status.h>

// standard
#include <sstream>
#include <iostream>
#include <filesystem>

// rebuf
#include <src/rebuf/parity/parity-check.hpp>

#define GTEST_COUT(chain) \
    std::cerr << "[INFO      ] " << chain << '\n';

TEST(ParityCheckTest, SampleRecord) {
    auto record = rebuf::makeSampleRecord(3);

    EXPECT_EQ(record.name, "Hello,WorldHello,WorldHello,World");
    EXPECT_EQ(record.value, 110234);
    EXPECT_EQ(record.sub.name, "Sub");
    EXPECT_EQ(record.sub.value, 1234);
}

TEST(ParityCheckTest, AllRoundTripsPass) {
    for (std::size_t chunkSize : {1, 5, 256, 4096}) {
        auto report = rebuf::runParityCheck(rebuf::makeSampleRecord(50), rebuf::ParitySettings{
            .chunkSize = chunkSize,
            .readers = 4,
            .scratchDirectory = BINARY_DIR
        });

        ASSERT_TRUE(report.ok()) << report.status().message();
        std::stringstream ss;
        ss << *report;
        GTEST_COUT("chunk size " << chunkSize << ":\n" << ss.str());
        EXPECT_TRUE(report->ok());
    }
}

TEST(ParityCheckTest, SystemTemporaryDirectory) {
    auto report = rebuf::runParityCheck(rebuf::makeSampleRecord(1), rebuf::ParitySettings{});

    ASSERT_TRUE(report.ok()) << report.status().message();
    EXPECT_TRUE(report->fileRoundTrip);
}

TEST(ParityCheckTest, InvalidSettings) {
    auto record = rebuf::makeSampleRecord(1);

    EXPECT_EQ(rebuf::runParityCheck(record, {.chunkSize = 0}).status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(rebuf::runParityCheck(record, {.chunkSize = 4, .readers = 0}).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParityCheckTest, MissingScratchDirectoryFails) {
    auto report = rebuf::runParityCheck(rebuf::makeSampleRecord(1), rebuf::ParitySettings{
        .chunkSize = 16,
        .readers = 1,
        .scratchDirectory = std::filesystem::path(BINARY_DIR) / "does-not-exist" / "nested"
    });

    EXPECT_FALSE(report.ok());
}
