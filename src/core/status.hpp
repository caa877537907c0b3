#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace core {

// Numeric values are part of the C API and must not change.
enum class Status {
    Success = 0,
    OutOfMemory = 1,
    IOError = 2,
    InvalidArgument = 3,
    StopIteration = 4,
    KeyError = 5,
    InvalidState = 6,
    RuntimeError = 7,
    ActivationError = 8,
    ActivationLimitReached = 9,
    ActivationThrottled = 10,
    ActivationRefused = 11,
};

const char* status_to_string(Status status);

/**
 * Exception thrown by every Eagle operation that fails.
 * Carries the status code plus a stack of messages, outermost context first.
 */
class EagleError : public std::runtime_error {
public:
    EagleError(Status status, const std::string& message,
               std::vector<std::string> message_stack = {});

    Status status() const { return m_status; }
    const std::string& message() const { return m_message; }
    const std::vector<std::string>& message_stack() const { return m_message_stack; }

    // Same status, with `context` pushed on top of the stack.
    EagleError with_context(const std::string& context) const;

private:
    Status m_status;
    std::string m_message;
    std::vector<std::string> m_message_stack;
};

[[noreturn]] void throw_error(Status status, const std::string& message);

} // namespace core
