#ifndef LOG_CAPTURE_HPP
#define LOG_CAPTURE_HPP

#include <string>
#include <vector>
#include <main/utils/logger.hpp>

// Collects logger output for the lifetime of the object
class LogCapture {
public:
    LogCapture() {
        previous_level = Logger::getLevel();
        Logger::setLevel(LogLevel::DEBUG);
        Logger::setSink(&LogCapture::record, this);
    }

    ~LogCapture() {
        Logger::setSink(nullptr, nullptr);
        Logger::setLevel(previous_level);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    int count(LogLevel level, const char* needle) const {
        int n = 0;
        for (const Line& line : lines) {
            if (line.level == level && line.text.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    int count(const char* needle) const {
        int n = 0;
        for (const Line& line : lines) {
            if (line.text.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

private:
    struct Line {
        LogLevel level;
        std::string tag;
        std::string text;
    };

    static void record(LogLevel level, const char* tag, const char* message, void* context) {
        static_cast<LogCapture*>(context)->lines.push_back(Line{level, tag, message});
    }

    std::vector<Line> lines;
    LogLevel previous_level;
};

#endif // LOG_CAPTURE_HPP
