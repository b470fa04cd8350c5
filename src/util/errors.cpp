#include "util/errors.hpp"

namespace sb {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::AccountNotFound: return "account_not_found";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::DuplicateCollision: return "duplicate_collision";
    case ErrorKind::SinkRejection: return "sink_rejection";
    default: throw std::invalid_argument("Unknown ErrorKind enum value");
    }
}

}
