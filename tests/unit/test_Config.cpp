#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "testFiles.hpp"

#include <nlohmann/json.hpp>

using namespace cn::config;
using namespace cn::test;

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir;

    std::string write(const std::string& yaml) const { return dir.fileWith("config.yaml", yaml).string(); }
};

TEST_F(ConfigTest, DefaultsMatchProductionBackend) {
    const Config cfg;
    EXPECT_EQ(cfg.upload.backend_base_url, "https://ai-meeting-notes-production-81d7.up.railway.app");
    EXPECT_EQ(cfg.upload.connect_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.upload.multipart_threshold_bytes, 80u * 1024 * 1024);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
    EXPECT_NO_THROW(cfg.upload.validate());
}

TEST_F(ConfigTest, LoadsFullFile) {
    const auto cfg = loadConfig(write(R"(
upload:
  backend_base_url: http://localhost:8000
  connect_timeout_seconds: 5
  multipart_threshold_mb: 16
logging:
  log_dir: /tmp/clipnote-logs
  log_levels:
    console_log_level: warn
    file_log_level: trace
    subsystem_levels:
      clipnote: debug
      upload: trace
      http: info
      io: error
)"));

    EXPECT_EQ(cfg.upload.backend_base_url, "http://localhost:8000");
    EXPECT_EQ(cfg.upload.connect_timeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.upload.multipart_threshold_bytes, 16u * 1024 * 1024);
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/clipnote-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.clipnote, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.upload, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::info);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.io, spdlog::level::err);
}

TEST_F(ConfigTest, MissingKeysTakeDefaults) {
    const auto cfg = loadConfig(write("upload:\n  connect_timeout_seconds: 10\n"));
    EXPECT_EQ(cfg.upload.backend_base_url, UploadConfig{}.backend_base_url);
    EXPECT_EQ(cfg.upload.connect_timeout, std::chrono::seconds(10));
    EXPECT_EQ(cfg.upload.multipart_threshold_bytes, DEFAULT_MULTIPART_THRESHOLD_BYTES);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::warn);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(loadConfig(write("upload:\n  multipart_threshold_mb: 0\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("upload:\n  connect_timeout_seconds: 0\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("upload:\n  backend_base_url: \"\"\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("upload:\n  backend_base_url: ftp://files.test\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("upload: [1, 2]\n")), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_ANY_THROW(loadConfig((dir.path() / "absent.yaml").string()));
}

TEST_F(ConfigTest, SerialisesToJson) {
    Config cfg;
    cfg.upload.multipart_threshold_bytes = 1024;
    const nlohmann::json j = cfg;

    EXPECT_EQ(j.at("upload").at("backend_base_url"), cfg.upload.backend_base_url);
    EXPECT_EQ(j.at("upload").at("connect_timeout_seconds"), 30);
    EXPECT_EQ(j.at("upload").at("multipart_threshold_bytes"), 1024);
    EXPECT_EQ(j.at("logging").at("log_levels").at("subsystem_levels").at("http"), "warning");
}
