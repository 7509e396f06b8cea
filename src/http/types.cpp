#include "http/types.hpp"
#include "util/httpHelpers.hpp"

#include <stdexcept>

namespace cn::http {

std::string to_string(const Method m) {
    switch (m) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        default: throw std::invalid_argument("Unknown HTTP method enum value");
    }
}

std::optional<std::string> Response::header(const std::string& name) const {
    const auto it = headers.find(util::toLower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

}
