/**
 * @file errors.hpp
 * @brief Exception types raised by adapters and parsers
 *
 * Every failure surfaces synchronously to the caller of the operation that
 * triggered it. There is no retry at this layer.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace dockhand {
namespace core {

/**
 * @class OrchestrationError
 * @brief Base class of every dockhand exception
 */
class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class BackendInvocationError
 * @brief Backend returned a non-zero exit code or an unexpected HTTP status
 *
 * Carries the backend's raw diagnostic text (stderr or response body).
 */
class BackendInvocationError : public OrchestrationError {
public:
    BackendInvocationError(const std::string& message,
                           const std::string& diagnostic,
                           int code = -1)
        : OrchestrationError(message + ": " + diagnostic)
        , diagnostic_(diagnostic)
        , code_(code) {}

    /// Raw backend output explaining the failure
    const std::string& diagnostic() const noexcept { return diagnostic_; }

    /// Process exit code or HTTP status (-1 when not applicable)
    int code() const noexcept { return code_; }

private:
    std::string diagnostic_;
    int code_;
};

/**
 * @class TimeoutError
 * @brief Command executed in a container exceeded its timeout
 */
class TimeoutError : public OrchestrationError {
public:
    explicit TimeoutError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @class ParseError
 * @brief Backend output could not be decoded into the expected shape
 */
class ParseError : public OrchestrationError {
public:
    explicit ParseError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @class ConfigError
 * @brief Configuration file missing, unreadable or invalid
 */
class ConfigError : public OrchestrationError {
public:
    explicit ConfigError(const std::string& message)
        : OrchestrationError(message) {}
};

} // namespace core
} // namespace dockhand
