#include "logger.hpp"

#include <iostream>

namespace capi_pipeline {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

StderrLogger::StderrLogger(LogLevel minLevel, std::string tag)
    : mMinLevel(minLevel)
    , mTag(std::move(tag)) {}

void StderrLogger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mMutex);
    mMinLevel = level;
}

void StderrLogger::log(LogLevel level, const std::string& message,
                       const LogFields& fields) {
    std::lock_guard<std::mutex> lock(mMutex);
    if (level < mMinLevel) return;

    std::cerr << "[" << mTag << "] " << logLevelName(level) << " " << message;
    for (const auto& [key, value] : fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << "\n";
}

} // namespace capi_pipeline
