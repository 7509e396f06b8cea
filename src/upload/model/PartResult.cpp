#include "upload/model/PartResult.hpp"

#include <nlohmann/json.hpp>

namespace cn::upload::model {

void to_json(nlohmann::json& j, const PartResult& p) {
    j = {
        {"ETag", p.eTag},
        {"PartNumber", p.partNumber}
    };
}

bool isContiguousFromOne(const std::vector<PartResult>& parts) {
    for (size_t i = 0; i < parts.size(); ++i)
        if (parts[i].partNumber != i + 1) return false;
    return true;
}

}
