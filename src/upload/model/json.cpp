#include "upload/model/json.hpp"
#include "upload/errors.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace cn::upload::model {

namespace {

const nlohmann::json* find(const nlohmann::json& j, const std::string& field) {
    if (!j.is_object()) throw PresignError("response body is not a JSON object");
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

}

std::string requireNonEmptyString(const nlohmann::json& j, const std::string& field) {
    const auto* v = find(j, field);
    if (!v) throw PresignError(fmt::format("response is missing required field '{}'", field));
    if (!v->is_string()) throw PresignError(fmt::format("field '{}' must be a string, got {}", field, v->type_name()));
    auto s = v->get<std::string>();
    if (s.empty()) throw PresignError(fmt::format("field '{}' must not be empty", field));
    return s;
}

std::optional<std::string> optionalString(const nlohmann::json& j, const std::string& field) {
    const auto* v = find(j, field);
    if (!v) return std::nullopt;
    if (!v->is_string()) throw PresignError(fmt::format("field '{}' must be a string, got {}", field, v->type_name()));
    return v->get<std::string>();
}

std::optional<uint64_t> optionalUnsigned(const nlohmann::json& j, const std::string& field) {
    const auto* v = find(j, field);
    if (!v) return std::nullopt;
    if (!v->is_number_unsigned())
        throw PresignError(fmt::format("field '{}' must be a non-negative integer, got {}", field, v->dump()));
    return v->get<uint64_t>();
}

std::map<std::string, std::string> optionalStringMap(const nlohmann::json& j, const std::string& field) {
    std::map<std::string, std::string> out;
    const auto* v = find(j, field);
    if (!v) return out;
    if (!v->is_object()) throw PresignError(fmt::format("field '{}' must be an object, got {}", field, v->type_name()));

    for (const auto& [k, val] : v->items()) {
        if (!val.is_string())
            throw PresignError(fmt::format("header '{}' in '{}' must be a string, got {}", k, field, val.type_name()));
        out.emplace(k, val.get<std::string>());
    }
    return out;
}

}
