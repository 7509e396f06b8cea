#include "upload/model/State.hpp"

#include <stdexcept>

namespace cn::upload::model {

std::string to_string(const State s) {
    switch (s) {
        case State::Idle: return "Idle";
        case State::SizingDecision: return "SizingDecision";
        case State::SimplePresign: return "SimplePresign";
        case State::SimpleUpload: return "SimpleUpload";
        case State::MultipartStart: return "MultipartStart";
        case State::PartRead: return "PartRead";
        case State::PartPresign: return "PartPresign";
        case State::PartUpload: return "PartUpload";
        case State::MultipartComplete: return "MultipartComplete";
        case State::Done: return "Done";
        case State::Failed: return "Failed";
        default: throw std::invalid_argument("Unknown State enum value");
    }
}

std::string to_string(const TransferMode m) {
    switch (m) {
        case TransferMode::Simple: return "simple";
        case TransferMode::Multipart: return "multipart";
        default: throw std::invalid_argument("Unknown TransferMode enum value");
    }
}

}
