// Upload
#include "upload/UploadTask.hpp"
#include "upload/PresignClient.hpp"
#include "upload/MimeResolver.hpp"
#include "upload/model/UploadRequest.hpp"
#include "upload/model/UploadResult.hpp"
#include "upload/model/UploadProgress.hpp"

// Transport
#include "http/CurlClient.hpp"

// Misc
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>

using namespace cn::config;
using namespace cn::upload;
using namespace cn::logging;

namespace {

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

struct Options {
    std::optional<std::string> configPath;
    std::string folder = model::UploadRequest::DEFAULT_FOLDER;
    bool verify = false;
    bool printConfig = false;
    std::string file;
};

void usage() {
    std::cerr << "usage: clipnote-upload [--config <path>] [--folder <name>] [--verify] [--print-config] <file>\n";
}

std::optional<Options> parseArgs(const int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "--folder") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return std::nullopt;
            }
            if (arg == "--config") o.configPath = argv[++i];
            else o.folder = argv[++i];
        } else if (arg == "--verify") o.verify = true;
        else if (arg == "--print-config") o.printConfig = true;
        else if (arg == "-h" || arg == "--help") return std::nullopt;
        else if (arg.starts_with("--")) {
            std::cerr << "unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (o.file.empty()) o.file = arg;
        else {
            std::cerr << "only one file may be uploaded at a time\n";
            return std::nullopt;
        }
    }
    if (o.file.empty() && !o.printConfig) return std::nullopt;
    return o;
}

bool verifyStored(const PresignClient& presign, const model::UploadSuccess& s) {
    const auto head = presign.headObject(s.objectKey);
    if (head.sizeBytes != s.sizeBytes) {
        std::cerr << fmt::format("verify: stored object is {} bytes, uploaded {}\n", head.sizeBytes, s.sizeBytes);
        return false;
    }
    std::cout << fmt::format("verified: {} bytes, ETag {}, {}\n", head.sizeBytes, head.eTag,
                             head.contentType.value_or("unknown type"));
    return true;
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        usage();
        return 2;
    }

    Config config;
    try {
        if (opts->configPath) config = loadConfig(*opts->configPath);
        else config.upload.validate();
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 2;
    }

    if (opts->printConfig) {
        std::cout << nlohmann::json(config).dump(2) << std::endl;
        if (opts->file.empty()) return 0;
    }

    try {
        LogRegistry::init(config.logging);

        const auto request = model::UploadRequest::fromFile(opts->file, opts->folder);
        if (!MimeResolver::isSupported(request.filename))
            LogRegistry::clipnote()->warn("[main] {} is not an .mp3, .m4a, .wav or .mp4 file; "
                                          "the backend will likely reject it", request.filename);

        const auto client = std::make_shared<cn::http::CurlClient>(config.upload.connect_timeout);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // curl reports progress far more often than the percentage changes
        auto task = UploadTask::start(config.upload, client, request,
            [last = std::string()](const model::UploadProgress& p) mutable {
                auto line = to_string(p);
                if (line == last) return;
                std::cout << line << std::endl;
                last = std::move(line);
            });

        while (!task->waitFor(std::chrono::milliseconds(200)))
            if (shouldExit) {
                LogRegistry::clipnote()->info("[main] Interrupted, abandoning upload of {}", request.filename);
                task->abandon();
            }

        const auto result = task->get();
        if (!result.ok()) {
            std::cerr << to_string(result) << std::endl;
            return 1;
        }

        const auto& s = result.success();
        std::cout << fmt::format("key: {}\n", s.objectKey);
        if (s.publicUrl) std::cout << fmt::format("public url: {}\n", *s.publicUrl);

        if (opts->verify && !verifyStored(PresignClient(client, config.upload.backend_base_url), s)) return 1;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "clipnote-upload: " << e.what() << std::endl;
        return 1;
    }
}
