#pragma once
#include <memory>
#include <string>
#include "core/logging.hpp"

namespace core {

class IActivationService;

// Runtime settings handed to every Profiler and Eagle at construction.
struct Config {
    std::string sdk = "cpp";                         // forwarded to the activation service
    LogLevel log_level = LogLevel::Warning;
    std::shared_ptr<IActivationService> activation;  // null: offline key check

    // Defaults overridden by EAGLE_SDK and EAGLE_LOG_LEVEL.
    static Config from_env();
};

}
