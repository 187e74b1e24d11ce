#pragma once

#include "Collaborators.hpp"
#include "NameTable.hpp"
#include "NetworkDescription.hpp"
#include "Scanner.hpp"
#include <map>
#include <optional>
#include <string>

namespace netdef {

// Failure kinds the collaborators can report while the circuit is built
enum class SemanticError {
    INVALID_QUALIFIER,
    NO_QUALIFIER,
    BAD_DEVICE,
    QUALIFIER_PRESENT,
    DEVICE_PRESENT,
    INPUT_TO_INPUT,
    OUTPUT_TO_OUTPUT,
    INPUT_CONNECTED,
    PORT_ABSENT,
    DEVICE_ABSENT,
    NOT_OUTPUT,
    MONITOR_PRESENT
};

enum class Severity { FATAL, WARNING };

std::string semanticErrorToString(SemanticError error);

// The four roles of a connection item
struct ConnectionRoles {
    Symbol firstDevice;
    std::optional<Symbol> firstPort;
    Symbol secondDevice;
    std::optional<Symbol> secondPort;
};

// Turns collaborator result codes into located diagnostics.
//
// The code table is built once from the collaborators' published codes.
// A code that is not in the table is a success and produces no output.
class SemanticErrorHandler {
public:
    SemanticErrorHandler(const NameTable& names, const Devices& devices,
                         const Network& network, const Monitors& monitors,
                         Scanner& scanner);

    // Reports the error code stands for, if any, at the right symbol of item.
    // Returns true if building must stop.
    bool handleError(ErrorCode code, const ItemDescriptor& item);

    std::optional<SemanticError> classify(ErrorCode code) const;

    static Severity severityOf(SemanticError error);

    // Connection item (5 or 7 symbols) split into its roles
    static ConnectionRoles labelConnection(const ItemDescriptor& item);

    // Lists every undriven device.pin, caret at anchor
    void reportUnconnectedInputs(const std::optional<Symbol>& anchor);

    int errorCount() const { return errorCount_; }
    int warningCount() const { return warningCount_; }

private:
    void report(SemanticError error, const ItemDescriptor& item);

    void reportQualifierError(SemanticError error, const ItemDescriptor& item);
    void reportDevicePresent(const ItemDescriptor& item);
    void reportInputToInput(const ItemDescriptor& item);
    void reportOutputToOutput(const ItemDescriptor& item);
    void reportInputConnected(const ItemDescriptor& item);
    void reportPortAbsent(const ItemDescriptor& item);
    void reportDeviceAbsent(const ItemDescriptor& item);
    void reportMonitorError(SemanticError error, const ItemDescriptor& item);

    std::string nameOf(const Symbol& symbol) const;

    // "device" or "device.port"
    std::string signalName(const Symbol& device, const std::optional<Symbol>& port) const;

    const NameTable& names_;
    const Devices& devices_;
    const Network& network_;
    Scanner& scanner_;

    std::map<ErrorCode, SemanticError> codes_;
    int errorCount_ = 0;
    int warningCount_ = 0;
};

} // namespace netdef
