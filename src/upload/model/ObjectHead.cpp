#include "upload/model/ObjectHead.hpp"
#include "upload/model/json.hpp"
#include "upload/errors.hpp"
#include "util/httpHelpers.hpp"

#include <nlohmann/json.hpp>

void cn::upload::model::from_json(const nlohmann::json& j, ObjectHead& h) {
    const auto size = optionalUnsigned(j, "size");
    if (!size) throw PresignError("head response is missing required field 'size'");
    h.sizeBytes = *size;
    h.eTag = util::stripQuotes(optionalString(j, "etag").value_or(""));
    h.contentType = optionalString(j, "content_type");
}
