/**
 * @file errors.hpp
 * @brief Typed failures raised by the execution engine
 *
 * Infrastructure problems (daemon unreachable, image unresolvable, rejected
 * configuration, timeouts) are modelled as exceptions derived from
 * EngineError. A nonzero process exit code is NOT an error of this layer and
 * is carried inside ExecResult instead.
 *
 * Programming errors (calling a lifecycle operation from the wrong state,
 * reading a result before it exists) raise InvalidStateError.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskbox {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of engine failures
 */
enum class ErrorKind {
    CONNECTION,     ///< Daemon unreachable
    IMAGE,          ///< Image missing or unresolvable
    CREATE,         ///< Daemon rejected the container configuration
    START,          ///< Container could not be started
    EXEC,           ///< Command invocation failed at the daemon layer
    OUT_OF_MEMORY,  ///< Process killed for exceeding the memory ceiling
    TIMEOUT,        ///< Wall-clock budget exceeded
    CANCELLED,      ///< Caller abandoned the unit
    CLEANUP,        ///< Resource release failed (logged only)
    CONFIG          ///< Invalid tier or configuration
};

/**
 * @brief Stable lowercase name of an error kind ("connection", "image", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @class EngineError
 * @brief Base class of every infrastructure-level failure
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConnectionError : public EngineError {
public:
    explicit ConnectionError(const std::string& message)
        : EngineError(ErrorKind::CONNECTION, message) {}
};

class ImageError : public EngineError {
public:
    explicit ImageError(const std::string& message)
        : EngineError(ErrorKind::IMAGE, message) {}
};

class CreateError : public EngineError {
public:
    explicit CreateError(const std::string& message)
        : EngineError(ErrorKind::CREATE, message) {}
};

class StartError : public EngineError {
public:
    explicit StartError(const std::string& message)
        : EngineError(ErrorKind::START, message) {}
};

class ExecError : public EngineError {
public:
    explicit ExecError(const std::string& message)
        : EngineError(ErrorKind::EXEC, message) {}

protected:
    ExecError(ErrorKind kind, const std::string& message)
        : EngineError(kind, message) {}
};

/// Raised when the runtime OOM-killed the unit's process; the unit is Failed("oom...").
class OutOfMemoryError : public ExecError {
public:
    explicit OutOfMemoryError(const std::string& message)
        : ExecError(ErrorKind::OUT_OF_MEMORY, message) {}
};

/// Distinct outcome: no partial result accompanies it.
class TimeoutError : public EngineError {
public:
    explicit TimeoutError(const std::string& message)
        : EngineError(ErrorKind::TIMEOUT, message) {}
};

class CancelledError : public EngineError {
public:
    explicit CancelledError(const std::string& message)
        : EngineError(ErrorKind::CANCELLED, message) {}
};

/// Only ever logged; never replaces a unit's terminal outcome.
class CleanupError : public EngineError {
public:
    explicit CleanupError(const std::string& message)
        : EngineError(ErrorKind::CLEANUP, message) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(ErrorKind::CONFIG, message) {}
};

/**
 * @class InvalidStateError
 * @brief A lifecycle operation was called from a state that does not allow it
 */
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace core
} // namespace taskbox
