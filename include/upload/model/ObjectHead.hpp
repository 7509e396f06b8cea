#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cn::upload::model {

// What the backend reports about a stored object
struct ObjectHead {
    uint64_t sizeBytes{0};
    std::string eTag;
    std::optional<std::string> contentType;
};

void from_json(const nlohmann::json& j, ObjectHead& h);

}
