#include <cassert>
#include <cstring>
#include <string>
#include "core/status.hpp"
#include "eagle/profiler.hpp"

int main() {
    using core::Status;
    assert(std::strcmp(core::status_to_string(Status::Success), "SUCCESS") == 0);
    assert(std::strcmp(core::status_to_string(Status::InvalidArgument), "INVALID_ARGUMENT") == 0);
    assert(std::strcmp(core::status_to_string(Status::ActivationRefused), "ACTIVATION_REFUSED") == 0);
    assert(static_cast<int>(Status::InvalidState) == 6);
    assert(static_cast<int>(Status::ActivationThrottled) == 10);

    assert(std::strcmp(eagle::enroll_feedback_to_string(eagle::EnrollFeedback::AudioOk), "AUDIO_OK") == 0);
    assert(std::strcmp(eagle::enroll_feedback_to_string(eagle::EnrollFeedback::QualityIssue), "QUALITY_ISSUE") == 0);
    assert(static_cast<int>(eagle::EnrollFeedback::NoVoiceFound) == 3);

    core::EagleError inner(Status::IOError, "cannot open file");
    core::EagleError outer = inner.with_context("failed to load model");
    assert(outer.status() == Status::IOError);
    assert(outer.message() == "failed to load model");
    assert(outer.message_stack().size() == 1);
    assert(outer.message_stack()[0] == "cannot open file");
    assert(std::string(outer.what()).find("cannot open file") != std::string::npos);

    bool thrown = false;
    try {
        core::throw_error(Status::KeyError, "missing");
    } catch (const core::EagleError& e) {
        thrown = e.status() == Status::KeyError;
    }
    assert(thrown);
    return 0;
}
