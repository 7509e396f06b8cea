#include "upload/model/PresignedTarget.hpp"
#include "upload/model/json.hpp"

#include <nlohmann/json.hpp>

void cn::upload::model::from_json(const nlohmann::json& j, PresignedTarget& t) {
    t.putUrl = requireNonEmptyString(j, "url");
    t.objectKey = requireNonEmptyString(j, "key");
    t.requiredHeaders = optionalStringMap(j, "headers");
    t.publicUrl = optionalString(j, "public_url");
}
