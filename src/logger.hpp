#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace capi_pipeline {

enum class LogLevel { Debug = 0, Info, Warn, Error };

const char* logLevelName(LogLevel level);

/// Structured fields, printed in insertion order.
using LogFields = std::vector<std::pair<std::string, std::string>>;

/// Leveled logger used by the interceptors, the token manager and the
/// batch executor.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message,
                     const LogFields& fields) = 0;

    void debug(const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::Debug, message, fields);
    }
    void info(const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::Info, message, fields);
    }
    void warn(const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::Warn, message, fields);
    }
    void error(const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::Error, message, fields);
    }
};

/// Writes "[tag] LEVEL message key=value ..." lines to std::cerr.
/// Records below the minimum level are dropped.
class StderrLogger : public Logger {
public:
    explicit StderrLogger(LogLevel minLevel = LogLevel::Info,
                          std::string tag   = "capi");

    void log(LogLevel level, const std::string& message,
             const LogFields& fields) override;

    void setMinLevel(LogLevel level);

private:
    std::mutex  mMutex;
    LogLevel    mMinLevel;
    std::string mTag;
};

/// Discards everything.
class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const LogFields&) override {}
};

} // namespace capi_pipeline
