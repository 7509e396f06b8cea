#include "upload/UploadOrchestrator.hpp"
#include "upload/ChunkReader.hpp"
#include "upload/errors.hpp"
#include "upload/model/PartResult.hpp"
#include "http/Client.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <system_error>
#include <vector>

using namespace cn::upload;
using namespace cn::upload::model;
using namespace cn::logging;

UploadOrchestrator::UploadOrchestrator(config::UploadConfig config, std::shared_ptr<http::Client> client)
    : config_(std::move(config)), presign_(client, config_.backend_base_url), transfer_(client) {
    config_.validate();
}

bool UploadOrchestrator::usesMultipart(const uint64_t sizeBytes) const {
    return sizeBytes >= config_.multipart_threshold_bytes;
}

void UploadOrchestrator::abandon() {
    abandoned_ = true;
}

UploadResult UploadOrchestrator::startUpload(const UploadRequest& request, const ProgressCallback& onProgress) {
    onProgress_ = onProgress;
    progress_ = {};
    currentPart_.reset();
    state_ = State::Idle;

    LogRegistry::upload()->info("[UploadOrchestrator] Uploading {} ({} bytes, {}) to folder '{}'",
                                request.filename, request.sizeBytes, request.contentType, request.destinationFolder);

    try {
        transition(State::SizingDecision);
        checkFileSize(request);
        checkAbandoned();

        const bool multipart = usesMultipart(request.sizeBytes);
        LogRegistry::upload()->debug("[UploadOrchestrator] {} bytes vs threshold {} -> {}",
                                     request.sizeBytes, config_.multipart_threshold_bytes,
                                     multipart ? "multipart" : "simple");

        auto success = multipart ? runMultipart(request) : runSimple(request);

        transition(State::Done);
        report(Phase::Done, 1.0, 0, success.mode == TransferMode::Multipart ? success.partCount : 0);

        UploadResult result{std::move(success)};
        LogRegistry::upload()->info("[UploadOrchestrator] {}", to_string(result));
        return result;
    } catch (const UploadError& e) {
        return fail(e.kind(), e.what(), e.httpStatus());
    } catch (const std::exception& e) {
        return fail(ErrorKind::Internal, e.what(), 0);
    }
}

UploadSuccess UploadOrchestrator::runSimple(const UploadRequest& request) {
    transition(State::SimplePresign);
    report(Phase::Presigning, 0.0);
    checkAbandoned();

    const auto target = presign_.presignSimple(request.filename, request.contentType, request.destinationFolder);

    transition(State::SimpleUpload);
    report(Phase::Uploading, 0.0);

    std::string bytes;
    {
        ChunkReader reader(request.sourcePath, request.sizeBytes, std::max<uint64_t>(request.sizeBytes, 1));
        if (auto chunk = reader.next()) bytes = std::move(chunk->bytes);
    }

    checkAbandoned();
    transfer_.putBytes(target.putUrl, std::move(bytes), target.requiredHeaders,
                       [this](const uint64_t sent, const uint64_t total) {
                           report(Phase::Uploading, static_cast<double>(sent) / static_cast<double>(total));
                       });

    UploadSuccess out;
    out.objectKey = target.objectKey;
    out.publicUrl = target.publicUrl;
    out.mode = TransferMode::Simple;
    out.sizeBytes = request.sizeBytes;
    out.partCount = 1;
    return out;
}

UploadSuccess UploadOrchestrator::runMultipart(const UploadRequest& request) {
    transition(State::MultipartStart);
    report(Phase::Presigning, 0.0);
    checkAbandoned();

    const auto session = presign_.presignMultipartStart(request.filename, request.contentType,
                                                        request.destinationFolder);

    ChunkReader reader(request.sourcePath, request.sizeBytes, session.partSizeBytes);
    const unsigned int totalParts = reader.partCount();
    const auto totalBytes = static_cast<double>(request.sizeBytes);

    LogRegistry::upload()->debug("[UploadOrchestrator] multipart key={} uploadId={}: {} parts of up to {} bytes",
                                 session.objectKey, session.uploadId, totalParts, session.partSizeBytes);

    std::vector<PartResult> parts;
    parts.reserve(totalParts);
    uint64_t sent = 0;

    while (!reader.done()) {
        const auto partNumber = static_cast<unsigned int>(parts.size() + 1);
        currentPart_ = partNumber;

        transition(State::PartPresign);
        report(Phase::PartN, static_cast<double>(sent) / totalBytes, partNumber, totalParts);
        checkAbandoned();
        const auto target = presign_.presignMultipartPart(session, partNumber);

        transition(State::PartRead);
        auto chunk = reader.next();
        if (!chunk || chunk->partNumber != partNumber)
            throw ProtocolInvariantError(fmt::format("Chunk sequence out of step with part {}", partNumber));

        transition(State::PartUpload);
        checkAbandoned();
        const auto len = static_cast<uint64_t>(chunk->bytes.size());
        const auto put = transfer_.putBytes(target.url, std::move(chunk->bytes), target.headers,
            [&, partNumber](const uint64_t partSent, const uint64_t) {
                report(Phase::PartN, static_cast<double>(sent + partSent) / totalBytes, partNumber, totalParts);
            },
            /*requireETag=*/true);

        parts.push_back({partNumber, *put.eTag});
        sent += len;
        report(Phase::PartN, static_cast<double>(sent) / totalBytes, partNumber, totalParts);

        LogRegistry::upload()->debug("[UploadOrchestrator] part {}/{} stored ({} bytes, ETag {})",
                                     partNumber, totalParts, len, parts.back().eTag);
    }

    currentPart_.reset();
    transition(State::MultipartComplete);
    report(Phase::Completing, static_cast<double>(sent) / totalBytes, 0, totalParts);

    if (parts.size() != totalParts || !isContiguousFromOne(parts))
        throw ProtocolInvariantError(fmt::format("Refusing to complete multipart upload: {} parts recorded, "
                                                 "expected 1..{} in order", parts.size(), totalParts));

    checkAbandoned();
    const auto completed = presign_.completeMultipart(session, parts);

    UploadSuccess out;
    out.objectKey = session.objectKey;
    out.publicUrl = completed.publicUrl;
    out.location = completed.location;
    out.versionId = completed.versionId;
    out.mode = TransferMode::Multipart;
    out.sizeBytes = request.sizeBytes;
    out.partCount = totalParts;
    return out;
}

UploadResult UploadOrchestrator::fail(const ErrorKind kind, const std::string& message, const long httpStatus) {
    UploadFailure f;
    f.kind = kind;
    f.stage = state_.load();
    f.message = message;
    f.httpStatus = httpStatus;
    f.partNumber = currentPart_;

    transition(State::Failed);
    report(Phase::Failed, progress_.fractionComplete, progress_.partNumber, progress_.totalParts);

    UploadResult result{std::move(f)};
    LogRegistry::upload()->error("[UploadOrchestrator] Upload failed: {}", to_string(result));
    return result;
}

void UploadOrchestrator::transition(const State next) {
    const auto prev = state_.exchange(next);
    LogRegistry::upload()->trace("[UploadOrchestrator] {} -> {}", to_string(prev), to_string(next));
}

void UploadOrchestrator::report(const Phase phase, const double fraction,
                                const unsigned int partNumber, const unsigned int totalParts) {
    double f = std::clamp(fraction, 0.0, 1.0);
    if (phase != Phase::Done) f = std::min(f, MAX_PENDING_FRACTION);
    f = std::max(f, progress_.fractionComplete);

    progress_ = {f, phase, phase == Phase::PartN ? partNumber : 0, totalParts};
    if (!onProgress_) return;

    try {
        onProgress_(progress_);
    } catch (const std::exception& e) {
        LogRegistry::upload()->warn("[UploadOrchestrator] progress observer threw, ignoring: {}", e.what());
    }
}

void UploadOrchestrator::checkAbandoned() const {
    if (abandoned_) throw AbandonedError();
}

void UploadOrchestrator::checkFileSize(const UploadRequest& request) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(request.sourcePath, ec);
    if (ec)
        throw IoError(fmt::format("Cannot read file size of {}: {}", request.sourcePath.string(), ec.message()));
    if (size != request.sizeBytes)
        throw IoError(fmt::format("File {} is {} bytes, expected {}", request.sourcePath.string(), size,
                                  request.sizeBytes));
}
