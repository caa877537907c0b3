#include <algorithm>
#include <cassert>
#include <memory>
#include <string>
#include <vector>
#include "core/activation.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "eagle/profiler.hpp"
#include "support/synthetic_voice.hpp"

namespace {

class ThrottledService : public core::IActivationService {
public:
    void activate(const std::string& access_key, const std::string& sdk) override {
        last_key = access_key;
        last_sdk = sdk;
        throw core::EagleError(core::Status::ActivationThrottled, "too many activations");
    }
    std::string last_key;
    std::string last_sdk;
};

class AcceptAllService : public core::IActivationService {
public:
    void activate(const std::string&, const std::string&) override { calls++; }
    int calls = 0;
};

core::Status activation_status(const std::string& key) {
    try {
        core::activate_or_throw(nullptr, key, "test");
    } catch (const core::EagleError& e) {
        return e.status();
    }
    return core::Status::Success;
}

std::vector<std::string> activation_stack(const std::string& key) {
    try {
        core::activate_or_throw(nullptr, key, "stack-test");
    } catch (const core::EagleError& e) {
        return e.message_stack();
    }
    return {};
}

} // namespace

int main() {
    assert(activation_status(testsupport::test_access_key()) == core::Status::Success);
    assert(activation_status("") == core::Status::InvalidArgument);
    assert(activation_status("short") == core::Status::ActivationError);
    assert(activation_status("has spaces in the middle of it") == core::Status::ActivationError);
    assert(activation_status("dGVzdC1hY2Nlc3Mta2V5=x") == core::Status::ActivationError);
    assert(activation_status("abcdefghijklmnop===") == core::Status::ActivationError);

    // Every rejection names the caller
    for (const char* key : {"short", "abcdefghijklmnop===", "has spaces in the middle of it"}) {
        std::vector<std::string> stack = activation_stack(key);
        assert(std::find(stack.begin(), stack.end(), "sdk: stack-test") != stack.end());
    }

    // A plugged-in service sees the key and the sdk tag, and its status surfaces from construction
    auto throttled = std::make_shared<ThrottledService>();
    core::Config config;
    config.sdk = "unit-test";
    config.activation = throttled;
    bool thrown = false;
    try {
        eagle::EagleProfiler profiler("any-opaque-key", "", config);
    } catch (const core::EagleError& e) {
        thrown = e.status() == core::Status::ActivationThrottled;
    }
    assert(thrown);
    assert(throttled->last_key == "any-opaque-key");
    assert(throttled->last_sdk == "unit-test");

    // The empty key is rejected before the service is asked
    auto accept = std::make_shared<AcceptAllService>();
    config.activation = accept;
    thrown = false;
    try {
        eagle::EagleProfiler profiler("", "", config);
    } catch (const core::EagleError& e) {
        thrown = e.status() == core::Status::InvalidArgument;
    }
    assert(thrown);
    assert(accept->calls == 0);

    eagle::EagleProfiler ok("not-base64 but accepted", "", config);
    assert(accept->calls == 1);
    return 0;
}
