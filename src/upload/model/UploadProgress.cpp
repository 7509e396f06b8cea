#include "upload/model/UploadProgress.hpp"

#include <cmath>
#include <fmt/core.h>
#include <stdexcept>

namespace cn::upload::model {

std::string to_string(const Phase p) {
    switch (p) {
        case Phase::Idle: return "Idle";
        case Phase::Presigning: return "Presigning";
        case Phase::Uploading: return "Uploading";
        case Phase::PartN: return "PartN";
        case Phase::Completing: return "Completing";
        case Phase::Done: return "Done";
        case Phase::Failed: return "Failed";
        default: throw std::invalid_argument("Unknown Phase enum value");
    }
}

std::string to_string(const UploadProgress& p) {
    const auto pct = static_cast<int>(std::floor(p.fractionComplete * 100.0));
    if (p.phase == Phase::PartN)
        return fmt::format("Part {}/{} uploading ({}%)", p.partNumber, p.totalParts, pct);
    return fmt::format("{} ({}%)", to_string(p.phase), pct);
}

}
