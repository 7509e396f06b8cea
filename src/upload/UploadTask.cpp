#include "upload/UploadTask.hpp"
#include "upload/UploadOrchestrator.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cn::upload;
using namespace cn::logging;

UploadTask::UploadTask(std::unique_ptr<UploadOrchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

std::unique_ptr<UploadTask> UploadTask::start(const config::UploadConfig& config,
                                              std::shared_ptr<http::Client> client,
                                              model::UploadRequest request,
                                              model::ProgressCallback onProgress) {
    std::unique_ptr<UploadTask> task(new UploadTask(std::make_unique<UploadOrchestrator>(config, std::move(client))));

    task->result_ = std::async(std::launch::async,
        [orchestrator = task->orchestrator_.get(), request = std::move(request), onProgress = std::move(onProgress)] {
            return orchestrator->startUpload(request, onProgress);
        });

    return task;
}

UploadTask::~UploadTask() {
    if (!result_.valid()) return;
    if (result_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        LogRegistry::upload()->warn("[UploadTask] Destroyed while running, abandoning upload");
        orchestrator_->abandon();
    }
    result_.wait();
}

void UploadTask::abandon() {
    orchestrator_->abandon();
}

void UploadTask::wait() const {
    if (result_.valid()) result_.wait();
}

bool UploadTask::waitFor(const std::chrono::milliseconds timeout) const {
    if (!result_.valid()) return true;
    return result_.wait_for(timeout) == std::future_status::ready;
}

cn::upload::model::UploadResult UploadTask::get() {
    if (!result_.valid()) throw std::logic_error("UploadTask result already retrieved");
    return result_.get();
}
