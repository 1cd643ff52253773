/**
 * Segue Engine - Diagnostic Logging
 */

#ifndef SEGUE_LOG_H
#define SEGUE_LOG_H

#include <cstdarg>
#include <cstdio>
#include <functional>
#include <string>

namespace segue {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/**
 * Tagged diagnostic lines ("[Tag] message").
 * With a callback every line is forwarded; without one, warnings and
 * errors go to stderr and the rest is dropped.
 */
class Logger {
public:
    explicit Logger(LogCallback callback = nullptr) : callback_(std::move(callback)) {}

    void set_callback(LogCallback callback) { callback_ = std::move(callback); }

    void log(LogLevel level, const char* tag, const char* fmt, ...) const {
        char body[512];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(body, sizeof(body), fmt, args);
        va_end(args);

        if (callback_) {
            callback_(level, std::string("[") + tag + "] " + body);
            return;
        }

        if (level >= LogLevel::Warning) {
            std::fprintf(stderr, "[%s] %s\n", tag, body);
        }
    }

private:
    LogCallback callback_;
};

} // namespace segue

#endif // SEGUE_LOG_H
