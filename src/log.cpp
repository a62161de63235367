#include "chaossynth/log.hpp"

#include <iostream>
#include <mutex>

namespace chaossynth {

namespace {
std::mutex logMutex;
}

void logInfo(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(logMutex);
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void logWarn(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(logMutex);
    std::cerr << "[" << tag << "] WARN " << msg << std::endl;
}

void logError(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(logMutex);
    std::cerr << "[" << tag << "] ERROR " << msg << std::endl;
}

}  // namespace chaossynth
