#include "netdef/SyntaxErrors.hpp"
#include <map>

namespace netdef {

namespace {

const std::map<SyntaxError, std::string>& messageTable() {
    static const std::map<SyntaxError, std::string> messages = {
        {SyntaxError::EXPECTED_DEVICES, "File must start with keyword 'DEVICES'."},
        {SyntaxError::EXPECTED_CONNECT, "';' after the last device should be followed by keyword 'CONNECT'."},
        {SyntaxError::EXPECTED_MONITOR, "';' after the last connection should be followed by keyword 'MONITOR'."},
        {SyntaxError::EXPECTED_END, "';' after the last monitor should be followed by keyword 'END'."},
        {SyntaxError::NO_DEVICES, "There should be at least one device."},
        {SyntaxError::MISSING_PROPERTY,
         "The required number of parameters for a device of the type CLOCK/SWITCH/AND/OR/NAND/NOR/RC/SIGGEN is 3. "
         "Should also check for incorrect placement of or missing punctuations."},
        {SyntaxError::MISSING_DEVICE_NAME,
         "The required number of parameters for a device of the type XOR/DTYPE is 2. "
         "Should also check for incorrect placement of or missing punctuations."},
        {SyntaxError::NOT_DEVICE_KEYWORD, "1st parameter of a device should be the keyword for that device."},
        {SyntaxError::BAD_DEVICE_NAME, "Device name should be a lowercase alphanumeric string (including '_')."},
        {SyntaxError::BAD_INTEGER_PROPERTY, "Clock period/RC time constant should be a positive integer."},
        {SyntaxError::BAD_SWITCH_STATE, "Switch state should be either 0 or 1."},
        {SyntaxError::BAD_FAN_IN, "Number of inputs for an AND/NAND/OR/NOR device should be between 1 and 16."},
        {SyntaxError::CONNECTION_SEPARATOR,
         "Connections should be separated by ',' and ended by ';'. "
         "Should also check for excessive parameters of a connection."},
        {SyntaxError::BAD_OUTPUT_PIN, "Output pins can only be Q or QBAR."},
        {SyntaxError::EXPECTED_ARROW, "2nd parameter of a connection should be '>'."},
        {SyntaxError::EXPECTED_INPUT_TARGET,
         "3rd parameter of a connection must be a device name followed by '.input_pin'."},
        {SyntaxError::BAD_INPUT_PIN,
         "The input pin should be one of the following: I1, I2,...,I16, DATA, CLK, SET, CLEAR."},
        {SyntaxError::MONITOR_SEPARATOR,
         "Monitors should be separated by ',' and ended by ';'. "
         "Should also check for excessive parameters of a monitor."},
        {SyntaxError::DEVICE_SEPARATOR,
         "Devices should be separated by ',' and ended by ';'. "
         "Should also check for excessive parameters of a device."},
        {SyntaxError::EXPECTED_COLON, "DEVICES, CONNECT and MONITOR should be followed by ':'."},
        {SyntaxError::EXPECTED_END_SEMICOLON, "'END' should be followed by ';'."},
        {SyntaxError::PREMATURE_EOF, "File ends too early (premature end of file). Should check for missing sections."},
        {SyntaxError::BAD_WAVEFORM, "Siggen waveform should only consist of 0s and 1s."},
        {SyntaxError::UNTERMINATED_COMMENT, "Comment opened with '!' is never closed."}
    };
    return messages;
}

} // namespace

const std::string& syntaxErrorMessage(SyntaxError error) {
    return messageTable().at(error);
}

const std::string& nameViolationMessage(NameViolation violation) {
    static const std::string firstChar = "First character is not a lowercase letter";
    static const std::string badChar = "Specific character is not a letter, digit or underscore";
    static const std::string notLower = "Specific character is not lowercase";

    switch (violation) {
        case NameViolation::FIRST_NOT_LOWERCASE_LETTER: return firstChar;
        case NameViolation::NOT_ALNUM_OR_UNDERSCORE:    return badChar;
        case NameViolation::NOT_LOWERCASE:              return notLower;
    }
    return firstChar;
}

} // namespace netdef
