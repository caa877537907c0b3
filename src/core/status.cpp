#include "core/status.hpp"

namespace core {

namespace {

std::string format_what(Status status, const std::string& message,
                        const std::vector<std::string>& stack) {
    std::string out = std::string("[") + status_to_string(status) + "] " + message;
    for (size_t i = 0; i < stack.size(); ++i) {
        out += "\n  [" + std::to_string(i) + "] " + stack[i];
    }
    return out;
}

} // namespace

const char* status_to_string(Status status) {
    switch (status) {
        case Status::Success: return "SUCCESS";
        case Status::OutOfMemory: return "OUT_OF_MEMORY";
        case Status::IOError: return "IO_ERROR";
        case Status::InvalidArgument: return "INVALID_ARGUMENT";
        case Status::StopIteration: return "STOP_ITERATION";
        case Status::KeyError: return "KEY_ERROR";
        case Status::InvalidState: return "INVALID_STATE";
        case Status::RuntimeError: return "RUNTIME_ERROR";
        case Status::ActivationError: return "ACTIVATION_ERROR";
        case Status::ActivationLimitReached: return "ACTIVATION_LIMIT_REACHED";
        case Status::ActivationThrottled: return "ACTIVATION_THROTTLED";
        case Status::ActivationRefused: return "ACTIVATION_REFUSED";
    }
    return "UNKNOWN_STATUS";
}

EagleError::EagleError(Status status, const std::string& message,
                       std::vector<std::string> message_stack)
    : std::runtime_error(format_what(status, message, message_stack))
    , m_status(status)
    , m_message(message)
    , m_message_stack(std::move(message_stack))
{
}

EagleError EagleError::with_context(const std::string& context) const {
    std::vector<std::string> stack;
    stack.reserve(m_message_stack.size() + 1);
    stack.push_back(m_message);
    stack.insert(stack.end(), m_message_stack.begin(), m_message_stack.end());
    return EagleError(m_status, context, std::move(stack));
}

void throw_error(Status status, const std::string& message) {
    throw EagleError(status, message);
}

} // namespace core
