#include "upload/model/MultipartSession.hpp"
#include "upload/model/json.hpp"
#include "upload/errors.hpp"

#include <nlohmann/json.hpp>

namespace cn::upload::model {

void from_json(const nlohmann::json& j, MultipartSession& s) {
    s.objectKey = requireNonEmptyString(j, "key");
    s.uploadId = requireNonEmptyString(j, "upload_id");

    const auto& ps = j.at("part_size");
    // nlohmann stores non-negative integer literals as unsigned
    if (!ps.is_number_unsigned() || ps.get<uint64_t>() == 0)
        throw PresignError("part_size must be a positive integer, got " + ps.dump());
    s.partSizeBytes = ps.get<uint64_t>();
}

void from_json(const nlohmann::json& j, PartTarget& t) {
    t.url = requireNonEmptyString(j, "url");
    t.headers = optionalStringMap(j, "headers");
}

void from_json(const nlohmann::json& j, CompletedUpload& c) {
    if (!j.is_object()) throw PresignError("completion response is not a JSON object");
    c.publicUrl = optionalString(j, "public_url");
    c.location = optionalString(j, "location");
    c.versionId = optionalString(j, "version_id");
}

}
