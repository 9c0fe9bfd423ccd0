#pragma once

#include "sdcp/protocol/DeviceDescriptor.hpp"

namespace sdcp::printer {

/**
 * Knowledge of which commands a printer model accepts. Supplied by the
 * application; a Printer without a catalog sends every command.
 */
class FeatureCatalog {
public:
    virtual ~FeatureCatalog() = default;
    virtual bool supports(const protocol::DeviceDescriptor& device, int command) const = 0;
};

} // namespace sdcp::printer
