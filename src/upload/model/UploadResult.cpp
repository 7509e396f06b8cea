#include "upload/model/UploadResult.hpp"

#include <fmt/core.h>

std::string cn::upload::model::to_string(const UploadResult& r) {
    if (r.ok()) {
        const auto& s = r.success();
        return fmt::format("Uploaded ({}, {} bytes, {} part{}) key={} public_url={}",
                           to_string(s.mode), s.sizeBytes, s.partCount, s.partCount == 1 ? "" : "s",
                           s.objectKey, s.publicUrl.value_or("<none>"));
    }

    const auto& f = r.failure();
    std::string out = fmt::format("{} at {}", upload::to_string(f.kind), to_string(f.stage));
    if (f.partNumber) out += fmt::format(" (part {})", *f.partNumber);
    if (f.httpStatus) out += fmt::format(" HTTP {}", f.httpStatus);
    return out + ": " + f.message;
}
