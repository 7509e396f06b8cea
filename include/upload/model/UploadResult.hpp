#pragma once

#include "upload/errors.hpp"
#include "upload/model/State.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace cn::upload::model {

struct UploadSuccess {
    std::string objectKey;
    std::optional<std::string> publicUrl;
    std::optional<std::string> location;    // multipart completion only
    std::optional<std::string> versionId;   // multipart completion only
    TransferMode mode{TransferMode::Simple};
    uint64_t sizeBytes{0};
    unsigned int partCount{0};
};

struct UploadFailure {
    ErrorKind kind{ErrorKind::Internal};
    State stage{State::Idle};
    std::string message;
    long httpStatus{0};
    std::optional<unsigned int> partNumber;
};

struct UploadResult {
    std::variant<UploadSuccess, UploadFailure> value;

    [[nodiscard]] bool ok() const { return std::holds_alternative<UploadSuccess>(value); }
    [[nodiscard]] const UploadSuccess& success() const { return std::get<UploadSuccess>(value); }
    [[nodiscard]] const UploadFailure& failure() const { return std::get<UploadFailure>(value); }
};

std::string to_string(const UploadResult& r);

}
