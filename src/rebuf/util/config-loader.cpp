// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

// nlohmann_json
#include <nlohmann/json.hpp>
#include <nlohmann/json_fwd.hpp>

// standard
#include <mutex>
#include <memory>
#include <fstream>
#include <filesystem>
#include <functional>
#include <string_view>
#include <system_error>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// rebuf
#include <src/rebuf/util/config-loader.hpp>

using namespace rebuf;


std::shared_ptr<ConfigHandler> ConfigHandler::configure(std::string_view configRootDirectory) {
    return std::shared_ptr<ConfigHandler>(new ConfigHandler{configRootDirectory});
}

ConfigHandler::ConfigHandler(std::string_view configRootDirectory)
    : default_(ConfigFile{
        .filepath = std::filesystem::path(configRootDirectory) / "default.cfg",
        .lastUpdatedTs = {},
        .contents = {},
        .isAvailable = false
    })
{}

absl::Status ConfigHandler::init() {
    absl::Status status;
    std::call_once(init_, [this, &status]() {
        std::unique_lock<std::mutex> locked(lock_);
        status = parseConfig(default_);
    });

    return status;
}

absl::Status ConfigHandler::reload() {
    std::vector<Subscriber> subs;
    nlohmann::json contents;
    {
        std::unique_lock<std::mutex> locked(lock_);

        std::error_code error;
        auto newTs = std::filesystem::last_write_time(default_.filepath, error);
        if (error) {
            return absl::NotFoundError(absl::StrFormat(
                "error while checking config file: %s, %s", default_.filepath.string(), error.message()));
        }
        if (default_.isAvailable && newTs <= default_.lastUpdatedTs) {
            return absl::OkStatus();
        }

        if (auto status = parseConfig(default_); !status.ok()) {
            PLOG(plog::warning) 
                << "error while updating config: " << status.message()
                << "; keeping previous contents";
            return status;
        }

        subs = subscribers_;
        contents = default_.contents;
    }

    for (const auto& sub : subs) {
        notify(sub, contents);
    }

    return absl::OkStatus();
}

absl::Status ConfigHandler::parseConfig(ConfigFile& config) {
    std::ifstream ifs {config.filepath, std::ios::in | std::ios::binary};
    if (!ifs) {
        return absl::NotFoundError(absl::StrFormat("error while opening config file: %s, ensure that it exists", config.filepath.string()));
    }

    std::string jsonString;
    std::size_t configFileSize = std::filesystem::file_size(config.filepath);
    jsonString.resize(configFileSize);

    if (static_cast<std::size_t>(ifs.read(jsonString.data(), configFileSize).gcount()) < configFileSize) {
        return absl::InternalError("error while reading file: not all bytes received");
    }

    auto contents = nlohmann::json::parse(jsonString, nullptr, false);
    if (contents.is_discarded() || !contents.is_object()) {
        return absl::InternalError("error while parsing json, ensure that config is correct");
    }

    config.contents = std::move(contents);
    config.lastUpdatedTs = std::filesystem::last_write_time(config.filepath);
    config.isAvailable = true;

    PLOG(plog::debug) << "config parsed: " << config.filepath.string();
    return absl::OkStatus();
}

void ConfigHandler::notify(const Subscriber& sub, const nlohmann::json& config) {
    if (sub.lifetime.lock()) {
        sub.callback((config.contains(sub.section)) ? config[sub.section] : nlohmann::json::object());
    }
}

void ConfigHandler::subscribe(
    const std::string& section, 
    std::function<void(const nlohmann::json&)> callback, 
    std::weak_ptr<void> lifetime) 
{
    Subscriber sub {
        .section = section,
        .callback = std::move(callback),
        .lifetime = std::move(lifetime)
    };
    nlohmann::json contents;
    {
        std::unique_lock<std::mutex> locked(lock_);
        subscribers_.push_back(sub);
        contents = default_.contents;
    }
    notify(sub, contents);
}

nlohmann::json ConfigHandler::section(const std::string& section) {
    std::unique_lock<std::mutex> locked(lock_);
    if (!default_.contents.is_object() || !default_.contents.contains(section)) {
        return nlohmann::json::object();
    }

    return default_.contents[section];
}

absl::StatusOr<ChunkedBuffer::Settings> rebuf::parseBufferSettings(const nlohmann::json& section) {
    ChunkedBuffer::Settings settings;
    if (!section.is_object() || !section.contains("chunk_size")) {
        return settings;
    }

    const auto& chunkSize = section["chunk_size"];
    if (!chunkSize.is_number_integer()) {
        return absl::InvalidArgumentError(absl::StrCat("chunk_size must be an integer, got: ", chunkSize.dump()));
    }
    if (chunkSize.get<std::int64_t>() <= 0) {
        return absl::InvalidArgumentError(absl::StrCat("illegal chunk size: ", chunkSize.get<std::int64_t>()));
    }

    settings.chunkSize = chunkSize.get<std::size_t>();
    return settings;
}

absl::StatusOr<LogSettings> rebuf::parseLogSettings(const nlohmann::json& section) {
    LogSettings settings;
    if (!section.is_object()) {
        return settings;
    }

    if (section.contains("severity")) {
        if (!section["severity"].is_string()) {
            return absl::InvalidArgumentError("logging severity must be a string");
        }
        auto name = section["severity"].get<std::string>();
        settings.severity = plog::severityFromString(name.c_str());
        if (settings.severity == plog::none && name != "none" && name != "NONE") {
            return absl::InvalidArgumentError(absl::StrCat("unknown logging severity: ", name));
        }
    }

    if (section.contains("file")) {
        if (!section["file"].is_string()) {
            return absl::InvalidArgumentError("logging file must be a string");
        }
        settings.file = section["file"].get<std::string>();
    }

    return settings;
}
