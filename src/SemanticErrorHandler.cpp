#include "netdef/SemanticErrorHandler.hpp"
#include "netdef/Debug.hpp"
#include <fmt/ranges.h>
#include <initializer_list>
#include <vector>

namespace netdef {

namespace {

// Which failures still let the circuit be built
const std::map<SemanticError, Severity>& severityTable() {
    static const std::map<SemanticError, Severity> table = {
        {SemanticError::INVALID_QUALIFIER, Severity::FATAL},
        {SemanticError::NO_QUALIFIER,      Severity::FATAL},
        {SemanticError::BAD_DEVICE,        Severity::FATAL},
        {SemanticError::QUALIFIER_PRESENT, Severity::FATAL},
        {SemanticError::DEVICE_PRESENT,    Severity::FATAL},
        {SemanticError::INPUT_TO_INPUT,    Severity::FATAL},
        {SemanticError::OUTPUT_TO_OUTPUT,  Severity::FATAL},
        {SemanticError::INPUT_CONNECTED,   Severity::FATAL},
        {SemanticError::PORT_ABSENT,       Severity::FATAL},
        {SemanticError::DEVICE_ABSENT,     Severity::FATAL},
        {SemanticError::NOT_OUTPUT,        Severity::FATAL},
        {SemanticError::MONITOR_PRESENT,   Severity::WARNING}
    };
    return table;
}

bool isMonitorShaped(const ItemDescriptor& item) {
    return item.size() == 1 || (item.size() == 3 && item[1].is(SymbolCategory::DOT));
}

// Port symbol of a monitor item if there is one, else its device symbol
const Symbol& monitorTarget(const ItemDescriptor& item) {
    return item.size() == 3 ? item[2] : item[0];
}

} // namespace

std::string semanticErrorToString(SemanticError error) {
    switch (error) {
        case SemanticError::INVALID_QUALIFIER: return "InvalidQualifier";
        case SemanticError::NO_QUALIFIER:      return "NoQualifier";
        case SemanticError::BAD_DEVICE:        return "BadDevice";
        case SemanticError::QUALIFIER_PRESENT: return "QualifierPresent";
        case SemanticError::DEVICE_PRESENT:    return "DevicePresent";
        case SemanticError::INPUT_TO_INPUT:    return "InputToInput";
        case SemanticError::OUTPUT_TO_OUTPUT:  return "OutputToOutput";
        case SemanticError::INPUT_CONNECTED:   return "InputConnected";
        case SemanticError::PORT_ABSENT:       return "PortAbsent";
        case SemanticError::DEVICE_ABSENT:     return "DeviceAbsent";
        case SemanticError::NOT_OUTPUT:        return "NotOutput";
        case SemanticError::MONITOR_PRESENT:   return "MonitorPresent";
    }
    return "Unknown";
}

SemanticErrorHandler::SemanticErrorHandler(const NameTable& names, const Devices& devices,
                                           const Network& network, const Monitors& monitors,
                                           Scanner& scanner)
    : names_(names), devices_(devices), network_(network), scanner_(scanner) {
    const Devices::ErrorCodes& deviceCodes = devices.errorCodes();
    codes_.emplace(deviceCodes.invalidQualifier, SemanticError::INVALID_QUALIFIER);
    codes_.emplace(deviceCodes.noQualifier, SemanticError::NO_QUALIFIER);
    codes_.emplace(deviceCodes.badDevice, SemanticError::BAD_DEVICE);
    codes_.emplace(deviceCodes.qualifierPresent, SemanticError::QUALIFIER_PRESENT);
    codes_.emplace(deviceCodes.devicePresent, SemanticError::DEVICE_PRESENT);

    const Network::ErrorCodes& networkCodes = network.errorCodes();
    codes_.emplace(networkCodes.inputToInput, SemanticError::INPUT_TO_INPUT);
    codes_.emplace(networkCodes.outputToOutput, SemanticError::OUTPUT_TO_OUTPUT);
    codes_.emplace(networkCodes.inputConnected, SemanticError::INPUT_CONNECTED);
    codes_.emplace(networkCodes.portAbsent, SemanticError::PORT_ABSENT);
    codes_.emplace(networkCodes.deviceAbsent, SemanticError::DEVICE_ABSENT);

    const Monitors::ErrorCodes& monitorCodes = monitors.errorCodes();
    codes_.emplace(monitorCodes.notOutput, SemanticError::NOT_OUTPUT);
    codes_.emplace(monitorCodes.monitorPresent, SemanticError::MONITOR_PRESENT);

    NETDEF_LOG(DebugLevel::TRACE, "Semantic code table holds {} codes", codes_.size());
}

std::optional<SemanticError> SemanticErrorHandler::classify(ErrorCode code) const {
    auto it = codes_.find(code);
    if (it == codes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Severity SemanticErrorHandler::severityOf(SemanticError error) {
    auto it = severityTable().find(error);
    return it != severityTable().end() ? it->second : Severity::FATAL;
}

bool SemanticErrorHandler::handleError(ErrorCode code, const ItemDescriptor& item) {
    std::optional<SemanticError> error = classify(code);
    if (!error) {
        return false;
    }

    report(*error, item);

    bool fatal = severityOf(*error) == Severity::FATAL;
    if (fatal) {
        ++errorCount_;
    } else {
        ++warningCount_;
    }
    NETDEF_LOG(DebugLevel::DETAIL, "Code {} classified as {} ({})", code,
               semanticErrorToString(*error), fatal ? "fatal" : "warning");
    return fatal;
}

ConnectionRoles SemanticErrorHandler::labelConnection(const ItemDescriptor& item) {
    if (item[1].is(SymbolCategory::DOT)) {
        std::optional<Symbol> secondPort;
        if (item.size() > 6 && item[5].is(SymbolCategory::DOT)) {
            secondPort = item[6];
        }
        return ConnectionRoles{item[0], item[2], item[4], secondPort};
    }

    std::optional<Symbol> secondPort;
    if (item.size() > 4 && item[3].is(SymbolCategory::DOT)) {
        secondPort = item[4];
    }
    return ConnectionRoles{item[0], std::nullopt, item[2], secondPort};
}

std::string SemanticErrorHandler::nameOf(const Symbol& symbol) const {
    return names_.resolve(symbol.getId()).value_or("?");
}

std::string SemanticErrorHandler::signalName(const Symbol& device, const std::optional<Symbol>& port) const {
    std::string name = nameOf(device);
    if (port) {
        name += "." + nameOf(*port);
    }
    return name;
}

void SemanticErrorHandler::report(SemanticError error, const ItemDescriptor& item) {
    switch (error) {
        case SemanticError::INVALID_QUALIFIER:
        case SemanticError::NO_QUALIFIER:
        case SemanticError::BAD_DEVICE:
        case SemanticError::QUALIFIER_PRESENT:
            reportQualifierError(error, item);
            break;
        case SemanticError::DEVICE_PRESENT:
            reportDevicePresent(item);
            break;
        case SemanticError::INPUT_TO_INPUT:
            reportInputToInput(item);
            break;
        case SemanticError::OUTPUT_TO_OUTPUT:
            reportOutputToOutput(item);
            break;
        case SemanticError::INPUT_CONNECTED:
            reportInputConnected(item);
            break;
        case SemanticError::PORT_ABSENT:
            reportPortAbsent(item);
            break;
        case SemanticError::DEVICE_ABSENT:
            reportDeviceAbsent(item);
            break;
        case SemanticError::NOT_OUTPUT:
        case SemanticError::MONITOR_PRESENT:
            reportMonitorError(error, item);
            break;
    }
}

// Cannot follow a syntactically valid device, reported for completeness
void SemanticErrorHandler::reportQualifierError(SemanticError error, const ItemDescriptor& item) {
    const Symbol& keyword = item[0];
    std::string device = item.size() > 1 ? nameOf(item[1]) : "";
    std::optional<Symbol> property;
    if (item.size() == 3) {
        property = item[2];
    }
    const Symbol& location = property ? *property : keyword;

    std::string message;
    switch (error) {
        case SemanticError::INVALID_QUALIFIER:
            message = fmt::format("Invalid property {} for device {}.", nameOf(location), device);
            break;
        case SemanticError::NO_QUALIFIER:
            message = fmt::format("Device {} of type {} requires a property.", device, nameOf(keyword));
            break;
        case SemanticError::QUALIFIER_PRESENT:
            message = fmt::format("Device {} of type {} does not take a property.", device, nameOf(keyword));
            break;
        default:
            message = fmt::format("{} is not a supported device type.", nameOf(keyword));
            break;
    }
    scanner_.printError(location, 0, message);
}

void SemanticErrorHandler::reportDevicePresent(const ItemDescriptor& item) {
    const Symbol& name = item[1];
    scanner_.printError(name, 0, fmt::format(
        "Device names are not unique. {} is already the name of a device", nameOf(name)));
}

void SemanticErrorHandler::reportInputToInput(const ItemDescriptor& item) {
    ConnectionRoles roles = labelConnection(item);
    std::string message = fmt::format(
        "Input {} is connected to input {}. Connections must be from outputs to inputs.",
        signalName(roles.firstDevice, roles.firstPort),
        signalName(roles.secondDevice, roles.secondPort));
    scanner_.printError(roles.firstPort ? *roles.firstPort : roles.firstDevice, 0, message);
}

// An input pin is mandatory on the second side, so the caret lands on the
// pin that turned out to be an output
void SemanticErrorHandler::reportOutputToOutput(const ItemDescriptor& item) {
    ConnectionRoles roles = labelConnection(item);
    std::string message = fmt::format(
        "Output {} is connected to output {}. Connections must be from outputs to inputs.",
        signalName(roles.firstDevice, roles.firstPort),
        signalName(roles.secondDevice, roles.secondPort));
    scanner_.printError(roles.secondPort ? *roles.secondPort : roles.secondDevice, 0, message);
}

void SemanticErrorHandler::reportInputConnected(const ItemDescriptor& item) {
    ConnectionRoles roles = labelConnection(item);
    std::string message = fmt::format(
        "A signal is already connected to input {}, so {} cannot be connected to it. "
        "Only one signal must be connected to an input.",
        signalName(roles.secondDevice, roles.secondPort),
        signalName(roles.firstDevice, roles.firstPort));
    scanner_.printError(roles.secondPort ? *roles.secondPort : roles.secondDevice, 0, message);
}

void SemanticErrorHandler::reportPortAbsent(const ItemDescriptor& item) {
    ConnectionRoles roles = labelConnection(item);
    const DeviceView* first = devices_.getDevice(roles.firstDevice.getId());
    const DeviceView* second = devices_.getDevice(roles.secondDevice.getId());

    if (roles.firstPort) {
        std::optional<NameId> port = roles.firstPort->getId();
        if (first == nullptr || first->outputs.count(port) == 0) {
            scanner_.printError(*roles.firstPort, 0, fmt::format(
                "Port {} is not defined for device {}", nameOf(*roles.firstPort), nameOf(roles.firstDevice)));
        }
    }

    if (roles.secondPort) {
        NameId port = roles.secondPort->getId();
        if (second == nullptr || second->inputs.count(port) == 0) {
            scanner_.printError(*roles.secondPort, 0, fmt::format(
                "Port {} is not defined for device {}", nameOf(*roles.secondPort), nameOf(roles.secondDevice)));
        }
    }
}

void SemanticErrorHandler::reportDeviceAbsent(const ItemDescriptor& item) {
    if (isMonitorShaped(item)) {
        scanner_.printError(item[0], 0, fmt::format("Device {} is not defined", nameOf(item[0])));
        return;
    }

    ConnectionRoles roles = labelConnection(item);
    for (const Symbol* device : {&roles.firstDevice, &roles.secondDevice}) {
        if (devices_.getDevice(device->getId()) == nullptr) {
            scanner_.printError(*device, 0, fmt::format("Device {} is not defined", nameOf(*device)));
        }
    }
}

void SemanticErrorHandler::reportMonitorError(SemanticError error, const ItemDescriptor& item) {
    const Symbol& target = monitorTarget(item);
    if (error == SemanticError::MONITOR_PRESENT) {
        scanner_.printError(target, 0, "Warning: Monitor exists at this output already.");
    } else {
        scanner_.printError(target, 0, "This is not an output. Only outputs can be monitored.");
    }
}

void SemanticErrorHandler::reportUnconnectedInputs(const std::optional<Symbol>& anchor) {
    std::vector<std::string> unconnected;
    for (NameId deviceId : devices_.findDevices(std::nullopt)) {
        const DeviceView* device = devices_.getDevice(deviceId);
        if (device == nullptr) {
            continue;
        }
        for (NameId input : device->inputs) {
            if (!network_.getConnectedOutput(deviceId, input)) {
                unconnected.push_back(names_.resolve(deviceId).value_or("?") + "." +
                                      names_.resolve(input).value_or("?"));
            }
        }
    }

    ++errorCount_;
    NETDEF_LOG(DebugLevel::DETAIL, "{} inputs left unconnected", unconnected.size());
    scanner_.printError(anchor, 0, fmt::format(
        "One or more inputs are left unconnected: {}", fmt::join(unconnected, ", ")));
}

} // namespace netdef
