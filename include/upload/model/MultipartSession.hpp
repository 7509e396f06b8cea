#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cn::upload::model {

struct MultipartSession {
    std::string objectKey;
    std::string uploadId;
    uint64_t partSizeBytes{0};
};

// One-time PUT target for a single part
struct PartTarget {
    std::string url;
    std::map<std::string, std::string> headers;
};

// Body of a successful multipart completion
struct CompletedUpload {
    std::optional<std::string> publicUrl;
    std::optional<std::string> location;
    std::optional<std::string> versionId;
};

void from_json(const nlohmann::json& j, MultipartSession& s);
void from_json(const nlohmann::json& j, PartTarget& t);
void from_json(const nlohmann::json& j, CompletedUpload& c);

}
