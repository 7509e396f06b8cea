#include "upload/errors.hpp"

std::string cn::upload::to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PresignError: return "PresignError";
        case ErrorKind::TransferError: return "TransferError";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::ProtocolInvariantError: return "ProtocolInvariantError";
        case ErrorKind::Abandoned: return "Abandoned";
        case ErrorKind::Internal: return "Internal";
        default: throw std::invalid_argument("Unknown ErrorKind enum value");
    }
}
