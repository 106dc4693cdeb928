// Abseil
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/strings/str_cat.h>

// standard
#include <memory>
#include <string>
#include <cstddef>
#include <iostream>
#include <optional>

// plog
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Severity.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Initializers/RollingFileInitializer.h>

// rebuf
#include <src/rebuf/macros.hpp>
#include <src/rebuf/util/config-loader.hpp>
#include <src/rebuf/parity/parity-check.hpp>

ABSL_FLAG(std::optional<std::string>, runtime_dir, std::nullopt, 
    "runtime directory for logs and configs");
ABSL_FLAG(std::optional<int>, chunk_size, std::nullopt, 
    "chunk size of tested buffer, overrides config");
ABSL_FLAG(int, repeat, rebuf::DefaultRecordRepeat, 
    "how many times record payload is repeated");
ABSL_FLAG(int, readers, rebuf::DefaultReaders, 
    "number of concurrent readers decoding the same buffer");

namespace {

    void initLogging(const rebuf::LogSettings& settings, const std::optional<std::string>& runtimeDirectory) {
        static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);

        if (settings.file.has_value() || runtimeDirectory.has_value()) {
            std::string logFile = (settings.file.has_value()) 
                ? settings.file.value() 
                : absl::StrCat(runtimeDirectory.value(), "/rebuf.log");
            plog::init(settings.severity, logFile.c_str(), 1024 * 1024, 2);
        } else {
            plog::init(settings.severity, &consoleAppender);
        }
    }

}

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);

    std::optional<std::string> runtimeDirectory = absl::GetFlag(FLAGS_runtime_dir);
    rebuf::ChunkedBuffer::Settings bufferSettings;
    rebuf::LogSettings logSettings;

    std::shared_ptr<rebuf::ConfigHandler> configHandler;
    if (runtimeDirectory.has_value()) {
        configHandler = rebuf::ConfigHandler::configure(runtimeDirectory.value());
        if (auto status = configHandler->init(); !status.ok()) {
            std::cerr << "error: " << status.message() << '\n';
            return 1;
        }

        auto parsedLog = rebuf::parseLogSettings(configHandler->section("logging"));
        if (!parsedLog.ok()) {
            std::cerr << "error: " << parsedLog.status().message() << '\n';
            return 1;
        }
        logSettings = *parsedLog;

        auto parsedBuffer = rebuf::parseBufferSettings(configHandler->section("buffer"));
        if (!parsedBuffer.ok()) {
            std::cerr << "error: " << parsedBuffer.status().message() << '\n';
            return 1;
        }
        bufferSettings = *parsedBuffer;
    }

    initLogging(logSettings, runtimeDirectory);
    PLOG(plog::debug) << "module created: " << "ConfigHandler; instance: " << configHandler.get();

    if (std::optional<int> chunkSize = absl::GetFlag(FLAGS_chunk_size); chunkSize.has_value()) {
        if (chunkSize.value() <= 0) {
            PLOG(plog::error) << "illegal chunk size: " << chunkSize.value();
            std::cerr << "error: illegal chunk size: " << chunkSize.value() << '\n';
            return 1;
        }
        bufferSettings.chunkSize = static_cast<std::size_t>(chunkSize.value());
    }

    int readers = absl::GetFlag(FLAGS_readers);
    if (readers <= 0) {
        std::cerr << "error: at least one reader is required\n";
        return 1;
    }

    auto record = rebuf::makeSampleRecord(absl::GetFlag(FLAGS_repeat));
    PLOG(plog::info) << "running parity check, chunk size: " << bufferSettings.chunkSize
        << "; record payload: " << record.name.size() << " bytes";

    auto report = rebuf::runParityCheck(record, rebuf::ParitySettings{
        .chunkSize = bufferSettings.chunkSize,
        .readers = static_cast<std::size_t>(readers),
        .scratchDirectory = runtimeDirectory.value_or("")
    });
    if (!report.ok()) {
        PLOG(plog::error) << "parity check did not run: " << report.status().message();
        std::cerr << "error: " << report.status().message() << '\n';
        return 1;
    }

    std::cout << *report;
    if (!report->ok()) {
        PLOG(plog::error) << "parity check failed";
        return 2;
    }

    return 0;
}
