#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

// Strict field accessors for backend responses; each throws PresignError on a schema mismatch.
namespace cn::upload::model {

std::string requireNonEmptyString(const nlohmann::json& j, const std::string& field);
std::optional<std::string> optionalString(const nlohmann::json& j, const std::string& field);
std::optional<uint64_t> optionalUnsigned(const nlohmann::json& j, const std::string& field);
std::map<std::string, std::string> optionalStringMap(const nlohmann::json& j, const std::string& field);

}
