#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cn::upload::model {

// Single-object upload credentials; valid for one upload attempt.
struct PresignedTarget {
    std::string putUrl;
    std::string objectKey;
    std::map<std::string, std::string> requiredHeaders;
    std::optional<std::string> publicUrl;
};

void from_json(const nlohmann::json& j, PresignedTarget& t);

}
