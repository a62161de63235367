// log.hpp
// tagged console lines, "[Tag] message"
#pragma once

#include <string>

namespace chaossynth {

void logInfo(const char* tag, const std::string& msg);
void logWarn(const char* tag, const std::string& msg);
void logError(const char* tag, const std::string& msg);

}  // namespace chaossynth
