#pragma once

#include "config/Config.hpp"
#include "upload/PresignClient.hpp"
#include "upload/TransferExecutor.hpp"
#include "upload/model/State.hpp"
#include "upload/model/UploadProgress.hpp"
#include "upload/model/UploadRequest.hpp"
#include "upload/model/UploadResult.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace cn::http { class Client; }

namespace cn::upload {

// Drives one upload through the presign handshake and the storage PUT(s).
//
// Files below the configured threshold go through a single presigned PUT; files
// at or above it go through a multipart session whose parts are presigned,
// read and uploaded strictly one after another. Every failure ends the attempt
// and is returned as an UploadFailure tagged with the state it happened in;
// nothing is retried and no abort is sent to the backend.
//
// An orchestrator runs one upload at a time. Per-upload state is reset at the
// start of every startUpload() call.
class UploadOrchestrator {
public:
    // Intermediate progress never reaches 1.0; that value is reserved for Done.
    static constexpr double MAX_PENDING_FRACTION = 0.99;

    UploadOrchestrator(config::UploadConfig config, std::shared_ptr<http::Client> client);

    model::UploadResult startUpload(const model::UploadRequest& request,
                                    const model::ProgressCallback& onProgress = {});

    // Thread-safe. The running upload stops before its next network call and
    // fails with ErrorKind::Abandoned; later startUpload() calls fail the same way.
    void abandon();

    [[nodiscard]] model::State state() const { return state_.load(); }
    [[nodiscard]] bool usesMultipart(uint64_t sizeBytes) const;

private:
    config::UploadConfig config_;
    PresignClient presign_;
    TransferExecutor transfer_;

    std::atomic<model::State> state_{model::State::Idle};
    std::atomic<bool> abandoned_{false};

    // per-upload
    model::ProgressCallback onProgress_;
    model::UploadProgress progress_;
    std::optional<unsigned int> currentPart_;

    model::UploadSuccess runSimple(const model::UploadRequest& request);
    model::UploadSuccess runMultipart(const model::UploadRequest& request);

    model::UploadResult fail(ErrorKind kind, const std::string& message, long httpStatus);

    void transition(model::State next);
    void report(model::Phase phase, double fraction, unsigned int partNumber = 0, unsigned int totalParts = 0);
    void checkAbandoned() const;
    void checkFileSize(const model::UploadRequest& request) const;
};

}
