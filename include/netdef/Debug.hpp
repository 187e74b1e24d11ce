#pragma once

#include <string>
#include <iostream> // For std::cerr
#include <fstream>  // For file logging
#include <optional>
#include <utility>
#include <fmt/format.h>

namespace netdef {

// Severity levels, most severe first
enum class DebugLevel {
    NONE,  // Special level to disable logging
    ERROR, // Faults that stop a phase (unreadable file, misuse of the API)
    WARN,  // Problems that let the compiler continue
    INFO,  // Phase summaries (symbols scanned, build outcome)
    DETAIL,// Section transitions, individual diagnostics
    TRACE  // Every symbol and every collaborator call
};

// Singleton logger shared by the whole front end.
// Compiler diagnostics meant for the user never go through here, they are
// written by the Scanner's DiagnosticSink.
class DebugLogger {
private:
    DebugLogger() : currentLevel_(DebugLevel::WARN), logStream_(&std::cerr) {}

    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    DebugLevel currentLevel_;
    std::ostream* logStream_;
    std::ofstream logFile_;

    static std::string getTimestamp();

public:
    static std::string levelToString(DebugLevel level);

    // Case-insensitive "none", "error", ... "trace". Empty optional for anything else.
    static std::optional<DebugLevel> parseLevel(const std::string& levelStr);

    static DebugLogger& getInstance() {
        static DebugLogger instance;
        return instance;
    }

    void setLevel(DebugLevel level) { currentLevel_ = level; }
    DebugLevel getLevel() const { return currentLevel_; }

    // Redirect to a file (truncated). An empty name means stderr.
    // Returns false and keeps logging to stderr if the file cannot be opened.
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    // Route log output to an arbitrary stream (tests capture logs this way).
    void setStream(std::ostream& stream);

    bool isEnabled(DebugLevel level) const {
        return level != DebugLevel::NONE && level <= currentLevel_;
    }

    template<typename... Args>
    void log(DebugLevel level, const std::string& format_str, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message;
        try {
            message = fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...);
        } catch (const fmt::format_error& e) {
            *logStream_ << "[ERROR] Format error in log message: " << e.what()
                        << " - Format string: " << format_str << std::endl;
            return;
        }

        *logStream_ << "[" << levelToString(level) << "] "
                    << getTimestamp() << " - "
                    << message << std::endl;
    }
};

using Debug = DebugLogger;

} // namespace netdef

// Checks the level before any formatting work is done
#define NETDEF_LOG(level, ...) \
    do { \
        if (::netdef::DebugLogger::getInstance().isEnabled(level)) { \
            ::netdef::DebugLogger::getInstance().log(level, __VA_ARGS__); \
        } \
    } while(0)
