#pragma once

#include "NameTable.hpp"
#include <optional>
#include <string>
#include <utility>

namespace netdef {

enum class SymbolCategory {
    KEYWORD,
    NAME,       // lowercase letter first, then lowercase letters, digits, '_'
    STRING,     // any other run of letters, digits and '_'
    NUMBER,     // digits with a leading zero
    INTEGER,    // digits, no leading zero
    INPUT_PIN,
    OUTPUT_PIN,
    SEMICOLON,
    COLON,
    COMMA,
    DOT,
    ARROW,
    OTHER
};

// Why a string is not a valid device name (see Symbol::indexNotName)
enum class NameViolation {
    FIRST_NOT_LOWERCASE_LETTER = 1,
    NOT_ALNUM_OR_UNDERSCORE = 2,
    NOT_LOWERCASE = 3
};

struct NameViolationAt {
    std::size_t offset;
    NameViolation violation;

    bool operator==(const NameViolationAt& other) const {
        return offset == other.offset && violation == other.violation;
    }
};

std::string categoryToString(SymbolCategory category);

// One token of a definition file. Immutable once built.
class Symbol {
public:
    Symbol(NameId id, SymbolCategory category, int line, int column)
        : id_(id), category_(category), line_(line), column_(column) {}

    // Builds a symbol whose category is derived from its text
    Symbol(const std::string& text, NameId id, int line, int column)
        : Symbol(id, classify(text), line, column) {}

    NameId getId() const { return id_; }
    SymbolCategory getCategory() const { return category_; }
    int getLine() const { return line_; }
    int getColumn() const { return column_; }

    bool is(SymbolCategory category) const { return category_ == category; }

    // Comma or semicolon: the points item-level recovery stops at
    bool isSeparator() const {
        return category_ == SymbolCategory::COMMA || category_ == SymbolCategory::SEMICOLON;
    }

    bool operator==(const Symbol& other) const {
        return id_ == other.id_ && category_ == other.category_ &&
               line_ == other.line_ && column_ == other.column_;
    }
    bool operator!=(const Symbol& other) const { return !(*this == other); }

    // Category of text. Pure function of the text and the fixed pin/keyword sets.
    static SymbolCategory classify(const std::string& text);

    static bool isString(const std::string& text);
    static bool isName(const std::string& text);
    static bool isNumber(const std::string& text);
    static bool isInteger(const std::string& text);

    static bool isKeyword(const std::string& text);
    static bool isInputPin(const std::string& text);
    static bool isOutputPin(const std::string& text);

    // First offset where text breaks the name rules, empty optional for a valid name
    static std::optional<NameViolationAt> indexNotName(const std::string& text);

    // First non-digit offset (0 for an empty text), empty optional for a number
    static std::optional<std::size_t> indexNotNumber(const std::string& text);

    // As indexNotNumber, and a leading zero is reported at offset 0
    static std::optional<std::size_t> indexNotInteger(const std::string& text);

    // (valid, first offset that is not '0' or '1'). Empty text is (false, 0).
    static std::pair<bool, std::optional<std::size_t>> isWaveform(const std::string& text);

private:
    NameId id_;
    SymbolCategory category_;
    int line_;
    int column_;
};

} // namespace netdef
