#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cn::config {

void UploadConfig::validate() const {
    if (backend_base_url.empty())
        throw std::runtime_error("upload.backend_base_url must not be empty");
    if (!backend_base_url.starts_with("http://") && !backend_base_url.starts_with("https://"))
        throw std::runtime_error("upload.backend_base_url must be an http(s) URL: " + backend_base_url);
    if (connect_timeout.count() <= 0)
        throw std::runtime_error("upload.connect_timeout_seconds must be positive");
    if (multipart_threshold_bytes == 0)
        throw std::runtime_error("upload.multipart_threshold_mb must be positive");
}

Config loadConfig(const std::string& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path);

    if (const auto node = root["upload"]; node && !YAML::convert<UploadConfig>::decode(node, cfg.upload))
        throw std::runtime_error("Config section 'upload' must be a map in " + path);
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::runtime_error("Config section 'logging' must be a map in " + path);

    cfg.upload.validate();
    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"upload", c.upload},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"backend_base_url", c.backend_base_url},
        {"connect_timeout_seconds", c.connect_timeout.count()},
        {"multipart_threshold_bytes", c.multipart_threshold_bytes}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", spdlog::level::to_string_view(c.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.file_log_level).data()},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"clipnote", spdlog::level::to_string_view(c.clipnote).data()},
        {"upload", spdlog::level::to_string_view(c.upload).data()},
        {"http", spdlog::level::to_string_view(c.http).data()},
        {"io", spdlog::level::to_string_view(c.io).data()}
    };
}

}
