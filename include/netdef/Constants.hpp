#pragma once

#include <cstddef> // For size_t

namespace netdef {
namespace Constants {

// Logic gates take between 1 and this many inputs (I1..I16)
static constexpr int MAX_GATE_INPUTS = 16;
static constexpr int MIN_GATE_INPUTS = 1;

// Section keywords, in the order the grammar requires them
static constexpr char KEYWORD_DEVICES[] = "DEVICES";
static constexpr char KEYWORD_CONNECT[] = "CONNECT";
static constexpr char KEYWORD_MONITOR[] = "MONITOR";
static constexpr char KEYWORD_END[] = "END";

// Device keywords
static constexpr const char* DEVICE_KEYWORDS[] = {
    "AND", "NAND", "OR", "NOR", "DTYPE", "XOR", "SWITCH", "CLOCK", "RC", "SIGGEN"
};

// D-type flip-flop pins (gate inputs I1..I16 are generated)
static constexpr const char* DTYPE_INPUT_PINS[] = {"DATA", "SET", "CLEAR", "CLK"};
static constexpr const char* OUTPUT_PINS[] = {"Q", "QBAR"};

// Diagnostics: caret drawn under the offending column
static constexpr char CARET = '^';

// Comment delimiters
static constexpr char LINE_COMMENT = '#';
static constexpr char BLOCK_COMMENT = '!';

} // namespace Constants
} // namespace netdef
