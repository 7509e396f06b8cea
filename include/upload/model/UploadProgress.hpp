#pragma once

#include <functional>
#include <string>

namespace cn::upload::model {

enum class Phase { Idle, Presigning, Uploading, PartN, Completing, Done, Failed };

std::string to_string(Phase p);

struct UploadProgress {
    double fractionComplete{0.0};   // [0, 1], non-decreasing within one attempt
    Phase phase{Phase::Idle};
    unsigned int partNumber{0};     // set while phase == PartN
    unsigned int totalParts{0};     // set for multipart uploads
};

std::string to_string(const UploadProgress& p);

using ProgressCallback = std::function<void(const UploadProgress&)>;

}
