/**
 * @file errors.cpp
 * @brief Engine error taxonomy
 *
 * @date 2025
 */

#include "taskbox/core/errors.hpp"

namespace taskbox {
namespace core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION:    return "connection";
        case ErrorKind::IMAGE:         return "image";
        case ErrorKind::CREATE:        return "create";
        case ErrorKind::START:         return "start";
        case ErrorKind::EXEC:          return "exec";
        case ErrorKind::OUT_OF_MEMORY: return "oom";
        case ErrorKind::TIMEOUT:       return "timeout";
        case ErrorKind::CANCELLED:     return "cancelled";
        case ErrorKind::CLEANUP:       return "cleanup";
        case ErrorKind::CONFIG:        return "config";
    }
    return "unknown";
}

EngineError::EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {
}

} // namespace core
} // namespace taskbox
