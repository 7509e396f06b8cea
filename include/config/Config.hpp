#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cn::config {

constexpr static uint64_t DEFAULT_MULTIPART_THRESHOLD_BYTES = 80ULL * 1024 * 1024; // 80 MiB

struct UploadConfig {
    std::string backend_base_url = "https://ai-meeting-notes-production-81d7.up.railway.app";
    std::chrono::seconds connect_timeout = std::chrono::seconds(30);
    uint64_t multipart_threshold_bytes = DEFAULT_MULTIPART_THRESHOLD_BYTES;

    // Throws std::runtime_error describing the first invalid field.
    void validate() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum clipnote = spdlog::level::info;   // CLI lifecycle
    spdlog::level::level_enum upload   = spdlog::level::info;   // state machine transitions and failures
    spdlog::level::level_enum http     = spdlog::level::warn;   // transport failures only
    spdlog::level::level_enum io       = spdlog::level::warn;   // local file problems
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::string log_dir;   // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    UploadConfig upload;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const UploadConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
