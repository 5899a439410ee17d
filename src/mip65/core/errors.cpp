#include <mip65/core/errors.hpp>

namespace mip65::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNAUTHORIZED:     return "UNAUTHORIZED";
        case ErrorCode::INVALID_DATE:     return "INVALID_DATE";
        case ErrorCode::UNKNOWN_ASSET:    return "UNKNOWN_ASSET";
        case ErrorCode::ALREADY_EXISTS:   return "ALREADY_EXISTS";
        case ErrorCode::OVERFLOW:         return "OVERFLOW";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

} // namespace mip65::core
