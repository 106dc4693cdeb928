#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// nlohmann_json
#include <nlohmann/json.hpp>
#include <nlohmann/json_fwd.hpp>

// plog
#include <plog/Severity.h>

// rebuf
#include <src/rebuf/buffer/chunked-buffer.hpp>

// standard
#include <mutex>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>
#include <string_view>


namespace rebuf {

    class ConfigHandler
        : public std::enable_shared_from_this<ConfigHandler> {
    public:

        static std::shared_ptr<ConfigHandler> configure(std::string_view configRootDirectory);

        // parses <root>/default.cfg, subsequent calls are no-op
        absl::Status init();
        // re-reads config if file was modified since last parse
        // and notifies subscribers on success
        absl::Status reload();

        // callback is invoked right away and after every successful reload
        // while lifetime is not expired
        void subscribe(const std::string& section, std::function<void(const nlohmann::json&)> callback, std::weak_ptr<void> lifetime);
        nlohmann::json section(const std::string& section);

    private:

        struct ConfigFile {
            std::filesystem::path filepath;
            std::filesystem::file_time_type lastUpdatedTs;
            nlohmann::json contents;

            bool isAvailable;
        };

        struct Subscriber {
            std::string section;
            std::function<void(const nlohmann::json&)> callback;
            std::weak_ptr<void> lifetime;
        };

        ConfigHandler(std::string_view configRootDirectory);

        void notify(const Subscriber& sub, const nlohmann::json& config);
        absl::Status parseConfig(ConfigFile& config);

    private:
        std::mutex lock_;
        std::once_flag init_;

        ConfigFile default_;
        std::vector<Subscriber> subscribers_;
    };

    struct LogSettings {
        plog::Severity severity = plog::info;
        // log to console if not set
        std::optional<std::string> file;
    };

    // "buffer": { "chunk_size": <positive integer> }
    absl::StatusOr<ChunkedBuffer::Settings> parseBufferSettings(const nlohmann::json& section);
    // "logging": { "severity": "debug", "file": "rebuf.log" }
    absl::StatusOr<LogSettings> parseLogSettings(const nlohmann::json& section);

} // namespace rebuf
