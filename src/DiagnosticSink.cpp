#include "netdef/DiagnosticSink.hpp"

namespace netdef {

void StreamSink::write(const std::string& text) {
    out_ << text;
    out_.flush();
}

void BufferSink::write(const std::string& text) {
    buffer_ << text;
}

} // namespace netdef
