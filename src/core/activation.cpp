#include "core/activation.hpp"
#include "core/status.hpp"
#include <cctype>

namespace core {

namespace {
constexpr size_t kMinKeyLength = 16;

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}
} // namespace

void OfflineActivationService::activate(const std::string& access_key, const std::string& sdk) {
    if (access_key.size() < kMinKeyLength) {
        throw EagleError(Status::ActivationError,
                         "AccessKey is too short (" + std::to_string(access_key.size()) + " characters)",
                         {"sdk: " + sdk});
    }
    // Padding may only appear at the end, at most twice.
    size_t body = access_key.find_last_not_of('=');
    if (body == std::string::npos || access_key.size() - body - 1 > 2) {
        throw EagleError(Status::ActivationError, "AccessKey is malformed", {"sdk: " + sdk});
    }
    for (size_t i = 0; i <= body; ++i) {
        if (!is_base64_char(access_key[i])) {
            throw EagleError(Status::ActivationError,
                             "AccessKey contains invalid character at position " + std::to_string(i),
                             {"sdk: " + sdk});
        }
    }
}

void activate_or_throw(IActivationService* service, const std::string& access_key,
                       const std::string& sdk) {
    if (access_key.empty()) {
        throw EagleError(Status::InvalidArgument, "AccessKey is required");
    }
    if (service) {
        service->activate(access_key, sdk);
        return;
    }
    OfflineActivationService offline;
    offline.activate(access_key, sdk);
}

} // namespace core
