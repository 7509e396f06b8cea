#pragma once

#include <string>

namespace cn::upload::model {

// Upload state machine states; a failure is tagged with the state it happened in.
enum class State {
    Idle,
    SizingDecision,
    SimplePresign,
    SimpleUpload,
    MultipartStart,
    PartRead,
    PartPresign,
    PartUpload,
    MultipartComplete,
    Done,
    Failed
};

std::string to_string(State s);

enum class TransferMode { Simple, Multipart };

std::string to_string(TransferMode m);

}
