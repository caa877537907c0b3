#pragma once

namespace eagle {

constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;
constexpr const char* kVersionString = "1.0.0";

inline const char* version() { return kVersionString; }

} // namespace eagle
