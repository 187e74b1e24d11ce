#pragma once

#include "DiagnosticSink.hpp"
#include "NameTable.hpp"
#include "Symbol.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netdef {

struct ScannerOptions {
    // Prefix the echoed source line with "Line N: "
    bool showLineNumbers = true;
};

// Reads a circuit definition file and turns it into Symbols.
//
// The whole file is tokenized once, in the constructor, and the symbols and
// source lines are cached. getSymbol() walks the cached symbols; running past
// the end returns an empty optional once and rewinds, so the next call starts
// again from the first symbol.
//
// Diagnostics are rendered as three lines (message, source line, caret) and
// written to the DiagnosticSink chosen at construction.
class Scanner {
public:
    // Throws std::runtime_error if path cannot be read.
    // A null sink means diagnostics go straight to std::cout.
    Scanner(const std::string& path, NameTable& names,
            std::unique_ptr<DiagnosticSink> sink = nullptr,
            ScannerOptions options = ScannerOptions());

    std::optional<Symbol> getSymbol();

    // What getSymbol() would return next, without moving the cursor
    std::optional<Symbol> peekSymbol() const;

    // Rewind so that the next getSymbol() returns the first symbol
    void resetCursor() { next_ = 0; }

    const std::vector<Symbol>& getAllSymbols() const { return symbols_; }
    std::optional<Symbol> lastSymbol() const;

    // Position of a '!' comment that is never closed, if there is one
    const std::optional<Symbol>& unterminatedComment() const { return unterminatedComment_; }

    // Source line lineNumber (1-based), without its line terminator
    std::optional<std::string> getLine(int lineNumber) const;

    // Reports message with a caret under column symbol.column + arrowOffset.
    // Returns false, after writing the message alone, if symbol is absent or
    // its line is not in the file.
    bool printError(const std::optional<Symbol>& symbol, int arrowOffset, const std::string& message);

    // Diagnostics accumulated by a buffering sink, "" for a direct one
    std::string getErrorMessages() const { return sink_->contents(); }

    const std::string& getPath() const { return path_; }

private:
    void loadFile(std::string& buffer) const;
    void tokenize(const std::string& buffer);
    void cacheLines(const std::string& buffer);

    std::string path_;
    NameTable& names_;
    std::unique_ptr<DiagnosticSink> sink_;
    ScannerOptions options_;

    std::vector<Symbol> symbols_;
    std::vector<std::string> lines_;
    std::optional<Symbol> unterminatedComment_;
    std::size_t next_ = 0; // index of the symbol getSymbol() returns next
};

} // namespace netdef
