#pragma once

#include <stdexcept>
#include <string>

namespace cn::upload {

enum class ErrorKind {
    PresignError,
    TransferError,
    IoError,
    ProtocolInvariantError,
    Abandoned,
    Internal
};

std::string to_string(ErrorKind kind);

struct UploadError : std::runtime_error {
    explicit UploadError(const std::string& msg) : std::runtime_error(msg) {}
    [[nodiscard]] virtual ErrorKind kind() const = 0;
    [[nodiscard]] virtual long httpStatus() const { return 0; }
};

// Backend rejected or returned a malformed presign, start, part-url, complete or head response.
struct PresignError final : UploadError {
    explicit PresignError(const std::string& msg, const long status = 0) : UploadError(msg), status_(status) {}
    [[nodiscard]] ErrorKind kind() const override { return ErrorKind::PresignError; }
    [[nodiscard]] long httpStatus() const override { return status_; }

private:
    long status_;
};

// Storage PUT failed, or a part response carried no ETag. status 0 means no HTTP response.
struct TransferError final : UploadError {
    TransferError(const std::string& msg, const long status, std::string body)
        : UploadError(msg), status_(status), body_(std::move(body)) {}
    [[nodiscard]] ErrorKind kind() const override { return ErrorKind::TransferError; }
    [[nodiscard]] long httpStatus() const override { return status_; }
    [[nodiscard]] const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

struct IoError final : UploadError {
    explicit IoError(const std::string& msg) : UploadError(msg) {}
    [[nodiscard]] ErrorKind kind() const override { return ErrorKind::IoError; }
};

struct ProtocolInvariantError final : UploadError {
    explicit ProtocolInvariantError(const std::string& msg) : UploadError(msg) {}
    [[nodiscard]] ErrorKind kind() const override { return ErrorKind::ProtocolInvariantError; }
};

struct AbandonedError final : UploadError {
    AbandonedError() : UploadError("Upload abandoned by caller") {}
    [[nodiscard]] ErrorKind kind() const override { return ErrorKind::Abandoned; }
};

}
