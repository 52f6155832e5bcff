#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;
Logger::Sink Logger::s_sink = nullptr;
void* Logger::s_sink_context = nullptr;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

LogLevel Logger::levelFromInt(int level) {
    if (level <= 0) {
        return LogLevel::ERROR;
    }
    if (level >= 3) {
        return LogLevel::DEBUG;
    }
    return static_cast<LogLevel>(level);
}

void Logger::setSink(Sink sink, void* context) {
    s_sink = sink;
    s_sink_context = context;
}

void Logger::emit(LogLevel level, const char* tag, const char* message) {
    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", message); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", message); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", message); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", message); break;
    }
    Sink sink = s_sink;
    if (sink != nullptr) {
        sink(level, tag, message, s_sink_context);
    }
}

void Logger::logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        emit(level, tag, "formatting error");
        return;
    }
    // Truncated output is still null-terminated by vsnprintf
    buffer[sizeof(buffer) - 1] = '\0';
    emit(level, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
