#pragma once

#include "config/Config.hpp"
#include "upload/model/UploadProgress.hpp"
#include "upload/model/UploadRequest.hpp"
#include "upload/model/UploadResult.hpp"

#include <chrono>
#include <future>
#include <memory>

namespace cn::http { class Client; }

namespace cn::upload {

class UploadOrchestrator;

// Runs one upload on a worker thread. Progress callbacks fire on that thread.
// Destroying a task that is still running abandons it and blocks until the
// worker has returned.
class UploadTask {
public:
    static std::unique_ptr<UploadTask> start(const config::UploadConfig& config,
                                             std::shared_ptr<http::Client> client,
                                             model::UploadRequest request,
                                             model::ProgressCallback onProgress = {});

    ~UploadTask();

    UploadTask(const UploadTask&) = delete;
    UploadTask& operator=(const UploadTask&) = delete;

    void abandon();

    void wait() const;
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    // Blocks until the upload finishes. May be called once.
    model::UploadResult get();

private:
    explicit UploadTask(std::unique_ptr<UploadOrchestrator> orchestrator);

    std::unique_ptr<UploadOrchestrator> orchestrator_;
    std::future<model::UploadResult> result_;
};

}
