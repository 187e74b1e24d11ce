#pragma once

#include "Collaborators.hpp"
#include "Debug.hpp"
#include "NameTable.hpp"
#include <string>

namespace netdef {

struct LoadOptions {
    DebugLevel logLevel = DebugLevel::WARN;
    std::string logFile;          // empty: log to stderr
    bool showLineNumbers = true;  // "Line N: " before echoed source lines
};

struct LoadResult {
    bool success = false;
    std::string messages;   // every diagnostic, in the order it was reported
    bool hasWarnings = false;
};

// Compiles the definition file at path into devices, network and monitors,
// collecting the diagnostics instead of printing them. A host application
// shows LoadResult::messages to the user.
//
// Files that cannot be read (and log files that cannot be opened) give a
// failed result whose messages hold the reason.
LoadResult loadDefinition(const std::string& path, NameTable& names, Devices& devices,
                          Network& network, Monitors& monitors,
                          const LoadOptions& options = LoadOptions());

} // namespace netdef
