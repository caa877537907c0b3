#include "core/config.hpp"
#include <cstdio>
#include <cstdlib>

namespace core {

Config Config::from_env() {
    Config config;
    if (const char* sdk = std::getenv("EAGLE_SDK")) {
        if (sdk[0] != '\0') config.sdk = sdk;
    }
    if (const char* level = std::getenv("EAGLE_LOG_LEVEL")) {
        LogLevel parsed;
        if (parse_log_level(level, parsed)) {
            config.log_level = parsed;
        } else {
            fprintf(stderr, "[Config] Ignoring unknown EAGLE_LOG_LEVEL '%s'\n", level);
        }
    }
    return config;
}

}
