#include "sdcp/protocol/DeviceDescriptor.hpp"

#include <algorithm>
#include <cctype>

namespace sdcp::protocol {

bool DeviceDescriptor::hasCapability(const std::string& flag) const {
    return std::find(capabilities.begin(), capabilities.end(), flag) != capabilities.end();
}

bool DeviceDescriptor::operator==(const DeviceDescriptor& other) const {
    return id == other.id
        && address == other.address
        && mainboardId == other.mainboardId
        && name == other.name
        && machineName == other.machineName
        && brandName == other.brandName
        && protocolVersion == other.protocolVersion
        && firmwareVersion == other.firmwareVersion
        && capabilities == other.capabilities
        && extra == other.extra;
}

std::optional<int> protocolMajor(const std::string& version) {
    std::size_t pos = 0;
    if (pos < version.size() && (version[pos] == 'V' || version[pos] == 'v')) {
        ++pos;
    }
    int major = 0;
    bool any = false;
    while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
        major = major * 10 + (version[pos] - '0');
        any = true;
        ++pos;
    }
    if (!any) {
        return std::nullopt;
    }
    return major;
}

} // namespace sdcp::protocol
