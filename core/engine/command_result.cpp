#include "engine/command_result.hpp"

namespace gitty {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:       return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::REFERENCE:  return "reference";
        case ErrorKind::STATE:      return "state";
    }
    return "unknown";
}

} // namespace gitty
