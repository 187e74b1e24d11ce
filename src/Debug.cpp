#include "netdef/Debug.hpp"
#include <algorithm> // For std::transform
#include <cctype>    // For ::toupper
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netdef {

std::string DebugLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt = *std::localtime(&timer);

    std::ostringstream oss;
    oss << std::put_time(&bt, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string DebugLogger::levelToString(DebugLevel level) {
    switch (level) {
        case DebugLevel::NONE:  return "NONE";
        case DebugLevel::ERROR: return "ERROR";
        case DebugLevel::WARN:  return "WARN";
        case DebugLevel::INFO:  return "INFO";
        case DebugLevel::DETAIL:return "DETAIL";
        case DebugLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

std::optional<DebugLevel> DebugLogger::parseLevel(const std::string& levelStr) {
    std::string upperLevelStr = levelStr;
    std::transform(upperLevelStr.begin(), upperLevelStr.end(), upperLevelStr.begin(), ::toupper);

    if (upperLevelStr == "NONE") return DebugLevel::NONE;
    if (upperLevelStr == "ERROR") return DebugLevel::ERROR;
    if (upperLevelStr == "WARN") return DebugLevel::WARN;
    if (upperLevelStr == "INFO") return DebugLevel::INFO;
    if (upperLevelStr == "DETAIL") return DebugLevel::DETAIL;
    if (upperLevelStr == "TRACE") return DebugLevel::TRACE;

    return std::nullopt;
}

bool DebugLogger::setLogFile(const std::string& filename) {
    closeLogFile();

    if (filename.empty()) {
        return true; // stderr
    }

    logFile_.open(filename, std::ios::out | std::ios::trunc);
    if (logFile_.is_open()) {
        logStream_ = &logFile_;
        return true;
    }
    // Fall back to stderr if file couldn't be opened
    logStream_ = &std::cerr;
    return false;
}

void DebugLogger::closeLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logStream_ = &std::cerr;
}

void DebugLogger::setStream(std::ostream& stream) {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logStream_ = &stream;
}

} // namespace netdef
