#pragma once

#include <ostream>
#include <sstream>
#include <string>

namespace netdef {

// Destination of the user-facing diagnostics rendered by the Scanner.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    // Appends text verbatim (callers supply the newlines)
    virtual void write(const std::string& text) = 0;

    // Everything accumulated so far. Sinks that write straight through return "".
    virtual std::string contents() const = 0;
};

// Writes each diagnostic as soon as it is reported (command-line use)
class StreamSink : public DiagnosticSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(const std::string& text) override;
    std::string contents() const override { return ""; }

private:
    std::ostream& out_;
};

// Keeps every diagnostic for bulk retrieval by a host application
class BufferSink : public DiagnosticSink {
public:
    void write(const std::string& text) override;
    std::string contents() const override { return buffer_.str(); }

private:
    std::ostringstream buffer_;
};

} // namespace netdef
