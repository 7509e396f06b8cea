#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cn::upload::model {

struct PartResult {
    unsigned int partNumber{0};   // 1-based
    std::string eTag;             // quotes stripped
};

// Serialises as {"ETag": ..., "PartNumber": ...}, the shape the completion endpoint expects
void to_json(nlohmann::json& j, const PartResult& p);

// True when part numbers are exactly 1..parts.size() in order.
[[nodiscard]] bool isContiguousFromOne(const std::vector<PartResult>& parts);

}
