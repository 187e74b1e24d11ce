#pragma once

#include "NameTable.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace netdef {

// A device output or input: (device id, port id). Outputs of single-output
// devices have no port id.
using PortRef = std::pair<NameId, std::optional<NameId>>;

// Port sets of one constructed device, as the simulator reports them
struct DeviceView {
    std::set<NameId> inputs;
    std::set<std::optional<NameId>> outputs;
};

// Interfaces the parser builds the circuit through. They are implemented by
// the simulator; the front end only consumes them.
//
// Each implementation mints its own result codes from the shared NameTable
// (NameTable::allocate) and publishes them through errorCodes(). Any code
// that is not one of the listed failure codes means success.

class Devices {
public:
    struct ErrorCodes {
        ErrorCode noError;
        ErrorCode invalidQualifier;
        ErrorCode noQualifier;
        ErrorCode badDevice;
        ErrorCode qualifierPresent;
        ErrorCode devicePresent;
    };

    virtual ~Devices() = default;

    virtual ErrorCode makeDevice(NameId deviceId, NameId deviceKind,
                                 const std::optional<std::string>& property) = 0;

    // Ids of every device, or only of those of deviceKind, in creation order
    virtual std::vector<NameId> findDevices(std::optional<NameId> deviceKind) const = 0;

    // nullptr if no device has this id
    virtual const DeviceView* getDevice(NameId deviceId) const = 0;

    virtual void coldStartup() = 0;

    virtual const ErrorCodes& errorCodes() const = 0;
};

class Network {
public:
    struct ErrorCodes {
        ErrorCode noError;
        ErrorCode inputToInput;
        ErrorCode outputToOutput;
        ErrorCode inputConnected;
        ErrorCode portAbsent;
        ErrorCode deviceAbsent;
    };

    virtual ~Network() = default;

    virtual ErrorCode makeConnection(NameId firstDevice, std::optional<NameId> firstPort,
                                     NameId secondDevice, std::optional<NameId> secondPort) = 0;

    // True when every declared input is driven
    virtual bool checkNetwork() const = 0;

    // Output driving (device, inputPort), empty if the input is unconnected
    virtual std::optional<PortRef> getConnectedOutput(NameId device, NameId inputPort) const = 0;

    // One simulation cycle. False means the network oscillates.
    virtual bool executeNetwork() = 0;

    virtual const ErrorCodes& errorCodes() const = 0;
};

class Monitors {
public:
    struct ErrorCodes {
        ErrorCode noError;
        ErrorCode notOutput;
        ErrorCode monitorPresent;
    };

    virtual ~Monitors() = default;

    virtual ErrorCode makeMonitor(NameId device, std::optional<NameId> outputPort) = 0;
    virtual ErrorCode removeMonitor(NameId device, std::optional<NameId> outputPort) = 0;
    virtual void resetMonitors() = 0;
    virtual void recordSignals() = 0;

    // Recorded signal levels per monitored output
    virtual const std::map<PortRef, std::vector<int>>& monitorsDictionary() const = 0;

    virtual const ErrorCodes& errorCodes() const = 0;
};

} // namespace netdef
