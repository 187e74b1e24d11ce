#include "netdef/Scanner.hpp"
#include "netdef/Constants.hpp"
#include "netdef/Debug.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace netdef {

namespace {

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

// Characters that end a letter-started token besides whitespace
bool endsWord(char c) {
    return c == ';' || c == ':' || c == ',' || c == '.';
}

} // namespace

Scanner::Scanner(const std::string& path, NameTable& names,
                 std::unique_ptr<DiagnosticSink> sink, ScannerOptions options)
    : path_(path), names_(names), sink_(std::move(sink)), options_(options) {
    if (!sink_) {
        sink_ = std::make_unique<StreamSink>(std::cout);
    }

    std::string buffer;
    loadFile(buffer);
    cacheLines(buffer);
    tokenize(buffer);

    NETDEF_LOG(DebugLevel::INFO, "Scanned {}: {} symbols on {} lines",
               path_, symbols_.size(), lines_.size());
    if (unterminatedComment_) {
        NETDEF_LOG(DebugLevel::WARN, "{}: comment opened at line {} column {} is never closed",
                   path_, unterminatedComment_->getLine(), unterminatedComment_->getColumn());
    }
}

void Scanner::loadFile(std::string& buffer) const {
    std::ifstream file(path_, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        NETDEF_LOG(DebugLevel::ERROR, "Scanner failed to open: {}", path_);
        throw std::runtime_error("Cannot open definition file: " + path_);
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size <= 0) {
        NETDEF_LOG(DebugLevel::DETAIL, "Definition file {} is empty", path_);
        buffer.clear();
        return;
    }

    buffer.resize(static_cast<std::size_t>(size));
    if (!file.read(&buffer[0], size)) {
        NETDEF_LOG(DebugLevel::ERROR, "Read of {} stopped after {} bytes", path_, file.gcount());
        throw std::runtime_error("Cannot read definition file: " + path_);
    }
}

void Scanner::cacheLines(const std::string& buffer) {
    std::istringstream stream(buffer);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines_.push_back(line);
    }
}

void Scanner::tokenize(const std::string& buffer) {
    const std::size_t n = buffer.size();
    std::size_t pos = 0;
    int line = 1;
    int column = 1;

    // Consume one character, keeping line/column in step
    auto step = [&]() {
        if (buffer[pos] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
        ++pos;
    };

    while (pos < n) {
        char c = buffer[pos];

        if (isSpace(c)) {
            step();
            continue;
        }

        if (c == Constants::LINE_COMMENT) {
            while (pos < n && buffer[pos] != '\n') {
                step();
            }
            continue;
        }

        if (c == Constants::BLOCK_COMMENT) {
            int openLine = line;
            int openColumn = column;
            step();
            while (pos < n && buffer[pos] != Constants::BLOCK_COMMENT) {
                step();
            }
            if (pos >= n) {
                unterminatedComment_ = Symbol(names_.intern(std::string(1, Constants::BLOCK_COMMENT)),
                                              SymbolCategory::OTHER, openLine, openColumn);
                break;
            }
            step(); // closing '!'
            continue;
        }

        int startLine = line;
        int startColumn = column;
        std::string text;

        if (isDigit(c)) {
            while (pos < n && isDigit(buffer[pos])) {
                text += buffer[pos];
                step();
            }
        } else if (isAlpha(c)) {
            while (pos < n && !isSpace(buffer[pos]) && !endsWord(buffer[pos])) {
                text += buffer[pos];
                step();
            }
        } else {
            text = c;
            step();
        }

        symbols_.emplace_back(text, names_.intern(text), startLine, startColumn);
        NETDEF_LOG(DebugLevel::TRACE, "Symbol '{}' ({}) at {}:{}", text,
                   categoryToString(symbols_.back().getCategory()), startLine, startColumn);
    }
}

std::optional<Symbol> Scanner::getSymbol() {
    if (next_ >= symbols_.size()) {
        next_ = 0;
        return std::nullopt;
    }
    return symbols_[next_++];
}

std::optional<Symbol> Scanner::peekSymbol() const {
    if (next_ >= symbols_.size()) {
        return std::nullopt;
    }
    return symbols_[next_];
}

std::optional<Symbol> Scanner::lastSymbol() const {
    if (symbols_.empty()) {
        return std::nullopt;
    }
    return symbols_.back();
}

std::optional<std::string> Scanner::getLine(int lineNumber) const {
    if (lineNumber < 1 || static_cast<std::size_t>(lineNumber) > lines_.size()) {
        return std::nullopt;
    }
    return lines_[static_cast<std::size_t>(lineNumber - 1)];
}

bool Scanner::printError(const std::optional<Symbol>& symbol, int arrowOffset, const std::string& message) {
    NETDEF_LOG(DebugLevel::DETAIL, "Diagnostic: {}", message);

    if (!symbol) {
        sink_->write(message + "\n");
        return false;
    }

    std::optional<std::string> source = getLine(symbol->getLine());
    if (!source) {
        sink_->write(message + "\n");
        return false;
    }

    std::string prefix = options_.showLineNumbers ? fmt::format("Line {}: ", symbol->getLine()) : "";
    int indent = static_cast<int>(prefix.size()) + symbol->getColumn() - 1 + arrowOffset;
    if (indent < 0) {
        indent = 0;
    }

    std::string text = message + "\n" + prefix + *source + "\n";
    text += std::string(static_cast<std::size_t>(indent), ' ');
    text += Constants::CARET;
    text += "\n";
    sink_->write(text);
    return true;
}

} // namespace netdef
