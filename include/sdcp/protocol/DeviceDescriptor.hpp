#pragma once

#include "sdcp/protocol/Frame.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sdcp::protocol {

/**
 * @brief What a printer says about itself in reply to a discovery probe.
 *
 * Required on the wire: `Id`, `Data.MainboardIP`, `Data.MainboardID`.
 * Everything else is optional; unrecognized `Data` members land in `extra`.
 */
struct DeviceDescriptor {
    std::string id;
    std::string address;
    std::string mainboardId;
    std::string name;
    std::string machineName;
    std::string brandName;
    std::string protocolVersion;
    std::string firmwareVersion;
    std::vector<std::string> capabilities;
    Json extra = Json::object();

    bool hasCapability(const std::string& flag) const;

    bool operator==(const DeviceDescriptor& other) const;
    bool operator!=(const DeviceDescriptor& other) const { return !(*this == other); }
};

/// Major version out of strings like "V3.0.0"; nullopt when unparsable.
std::optional<int> protocolMajor(const std::string& version);

} // namespace sdcp::protocol
