#include "netdef/Symbol.hpp"
#include "netdef/Constants.hpp"
#include <cctype>
#include <iterator>
#include <string>
#include <unordered_set>

namespace netdef {

namespace {

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isLower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool isUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool isAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool isWordChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

const std::unordered_set<std::string>& keywordSet() {
    static const std::unordered_set<std::string> keywords = [] {
        std::unordered_set<std::string> words = {
            Constants::KEYWORD_DEVICES, Constants::KEYWORD_CONNECT,
            Constants::KEYWORD_MONITOR, Constants::KEYWORD_END
        };
        for (const char* device : Constants::DEVICE_KEYWORDS) {
            words.insert(device);
        }
        return words;
    }();
    return keywords;
}

const std::unordered_set<std::string>& inputPinSet() {
    static const std::unordered_set<std::string> pins = [] {
        std::unordered_set<std::string> names;
        for (int i = Constants::MIN_GATE_INPUTS; i <= Constants::MAX_GATE_INPUTS; ++i) {
            names.insert("I" + std::to_string(i));
        }
        for (const char* pin : Constants::DTYPE_INPUT_PINS) {
            names.insert(pin);
        }
        return names;
    }();
    return pins;
}

const std::unordered_set<std::string>& outputPinSet() {
    static const std::unordered_set<std::string> pins(
        std::begin(Constants::OUTPUT_PINS), std::end(Constants::OUTPUT_PINS));
    return pins;
}

} // namespace

std::string categoryToString(SymbolCategory category) {
    switch (category) {
        case SymbolCategory::KEYWORD:    return "keyword";
        case SymbolCategory::NAME:       return "name";
        case SymbolCategory::STRING:     return "string";
        case SymbolCategory::NUMBER:     return "number";
        case SymbolCategory::INTEGER:    return "integer";
        case SymbolCategory::INPUT_PIN:  return "input_pin";
        case SymbolCategory::OUTPUT_PIN: return "output_pin";
        case SymbolCategory::SEMICOLON:  return "semicolon";
        case SymbolCategory::COLON:      return "colon";
        case SymbolCategory::COMMA:      return "comma";
        case SymbolCategory::DOT:        return "dot";
        case SymbolCategory::ARROW:      return "arrow";
        case SymbolCategory::OTHER:      return "other";
        default: return "unknown";
    }
}

bool Symbol::isKeyword(const std::string& text) {
    return keywordSet().count(text) != 0;
}

bool Symbol::isInputPin(const std::string& text) {
    return inputPinSet().count(text) != 0;
}

bool Symbol::isOutputPin(const std::string& text) {
    return outputPinSet().count(text) != 0;
}

bool Symbol::isString(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!isWordChar(c)) {
            return false;
        }
    }
    return true;
}

bool Symbol::isName(const std::string& text) {
    return !indexNotName(text).has_value();
}

bool Symbol::isNumber(const std::string& text) {
    return !indexNotNumber(text).has_value();
}

bool Symbol::isInteger(const std::string& text) {
    return !indexNotInteger(text).has_value();
}

SymbolCategory Symbol::classify(const std::string& text) {
    if (isInputPin(text)) {
        return SymbolCategory::INPUT_PIN;
    }
    if (isOutputPin(text)) {
        return SymbolCategory::OUTPUT_PIN;
    }
    if (isKeyword(text)) {
        return SymbolCategory::KEYWORD;
    }
    if (isNumber(text)) {
        return isInteger(text) ? SymbolCategory::INTEGER : SymbolCategory::NUMBER;
    }
    if (isString(text)) {
        return isName(text) ? SymbolCategory::NAME : SymbolCategory::STRING;
    }
    if (text.size() == 1) {
        switch (text[0]) {
            case ';': return SymbolCategory::SEMICOLON;
            case ':': return SymbolCategory::COLON;
            case ',': return SymbolCategory::COMMA;
            case '.': return SymbolCategory::DOT;
            case '>': return SymbolCategory::ARROW;
            default: break;
        }
    }
    return SymbolCategory::OTHER;
}

std::optional<NameViolationAt> Symbol::indexNotName(const std::string& text) {
    if (text.empty()) {
        return NameViolationAt{0, NameViolation::FIRST_NOT_LOWERCASE_LETTER};
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (i == 0 && !isLower(c)) {
            return NameViolationAt{i, NameViolation::FIRST_NOT_LOWERCASE_LETTER};
        }
        if (!isWordChar(c)) {
            return NameViolationAt{i, NameViolation::NOT_ALNUM_OR_UNDERSCORE};
        }
        if (isAlpha(c) && isUpper(c)) {
            return NameViolationAt{i, NameViolation::NOT_LOWERCASE};
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Symbol::indexNotNumber(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isDigit(text[i])) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Symbol::indexNotInteger(const std::string& text) {
    if (text.empty() || text[0] == '0') {
        return 0;
    }
    return indexNotNumber(text);
}

std::pair<bool, std::optional<std::size_t>> Symbol::isWaveform(const std::string& text) {
    if (text.empty()) {
        return {false, 0};
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '0' && text[i] != '1') {
            return {false, i};
        }
    }
    return {true, std::nullopt};
}

} // namespace netdef
