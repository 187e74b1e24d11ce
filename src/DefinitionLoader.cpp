#include "netdef/DefinitionLoader.hpp"
#include "netdef/DiagnosticSink.hpp"
#include "netdef/Parser.hpp"
#include "netdef/Scanner.hpp"
#include <memory>
#include <stdexcept>

namespace netdef {

LoadResult loadDefinition(const std::string& path, NameTable& names, Devices& devices,
                          Network& network, Monitors& monitors, const LoadOptions& options) {
    Debug& logger = Debug::getInstance();
    logger.setLevel(options.logLevel);

    LoadResult result;
    try {
        if (!options.logFile.empty() && !logger.setLogFile(options.logFile)) {
            throw std::runtime_error("Cannot open log file: " + options.logFile);
        }

        ScannerOptions scannerOptions;
        scannerOptions.showLineNumbers = options.showLineNumbers;
        Scanner scanner(path, names, std::make_unique<BufferSink>(), scannerOptions);
        Parser parser(names, devices, network, monitors, scanner);

        result.success = parser.parseNetwork();
        result.messages = scanner.getErrorMessages();
        result.hasWarnings = parser.warningCount() > 0;
    } catch (const std::runtime_error& e) {
        NETDEF_LOG(DebugLevel::ERROR, "Loading {} failed: {}", path, e.what());
        result.success = false;
        result.messages = std::string(e.what()) + "\n";
    }

    NETDEF_LOG(DebugLevel::INFO, "Loaded {}: {}", path, result.success ? "ok" : "rejected");
    return result;
}

} // namespace netdef
