#pragma once
#include <memory>
#include <string>

namespace core {

// Validates an AccessKey before an engine is created.
// Implementations throw core::EagleError with one of the Activation* statuses.
class IActivationService {
public:
    virtual ~IActivationService() = default;
    virtual void activate(const std::string& access_key, const std::string& sdk) = 0;
};

// Checks key shape only: base64 alphabet, at least 16 characters.
class OfflineActivationService : public IActivationService {
public:
    void activate(const std::string& access_key, const std::string& sdk) override;
};

// Empty key is InvalidArgument; otherwise defers to `service` (offline check when null).
void activate_or_throw(IActivationService* service, const std::string& access_key,
                       const std::string& sdk);

} // namespace core
