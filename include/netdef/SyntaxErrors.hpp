#pragma once

#include "Symbol.hpp"
#include <string>

namespace netdef {

// Numbered syntax errors. The numbers appear in logs and are stable.
enum class SyntaxError {
    EXPECTED_DEVICES = 1,
    EXPECTED_CONNECT = 2,
    EXPECTED_MONITOR = 3,
    EXPECTED_END = 4,
    NO_DEVICES = 5,
    MISSING_PROPERTY = 6,
    MISSING_DEVICE_NAME = 7,
    NOT_DEVICE_KEYWORD = 8,
    BAD_DEVICE_NAME = 9,
    BAD_INTEGER_PROPERTY = 10,
    BAD_SWITCH_STATE = 11,
    BAD_FAN_IN = 12,
    CONNECTION_SEPARATOR = 13,
    BAD_OUTPUT_PIN = 14,
    EXPECTED_ARROW = 15,
    EXPECTED_INPUT_TARGET = 16,
    BAD_INPUT_PIN = 17,
    MONITOR_SEPARATOR = 18,
    DEVICE_SEPARATOR = 19,
    EXPECTED_COLON = 20,
    EXPECTED_END_SEMICOLON = 21,
    PREMATURE_EOF = 22,
    BAD_WAVEFORM = 23,
    UNTERMINATED_COMMENT = 24
};

inline int syntaxErrorNumber(SyntaxError error) { return static_cast<int>(error); }

// User-facing text of a syntax error
const std::string& syntaxErrorMessage(SyntaxError error);

// Explanation appended to BAD_DEVICE_NAME
const std::string& nameViolationMessage(NameViolation violation);

} // namespace netdef
