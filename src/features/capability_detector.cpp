#include "features/capability_detector.hpp"

#include <iostream>
#include <utility>

CapabilityDetector::CapabilityDetector(IwBackend backend)
    : m_backend(std::move(backend)) {}

Result<std::vector<WirelessInterface>> CapabilityDetector::detect() const {
    std::string dev_output;
    if (!m_backend.query_devices(dev_output)) {
        return HotspotError(ErrorKind::NoInterfaceFound, "Failed to run iw dev");
    }

    // Without combination data every interface is reported as not capable.
    std::string list_output;
    if (!m_backend.query_phys(list_output)) {
        std::cerr << "Warning: iw list failed, AP+Managed support unknown\n";
        list_output.clear();
    }

    auto inventory = iw::build_inventory(dev_output, list_output);
    if (auto* interfaces = std::get_if<std::vector<WirelessInterface>>(&inventory)) {
        for (const auto& iface : *interfaces) {
            std::cerr << "Detected " << iface.name << " (" << iface.phy << ", " << iface.mode
                      << ", channel " << iface.channel << "): "
                      << (iface.supports_ap_managed ? "AP+Managed supported" : "AP+Managed not supported")
                      << '\n';
        }
    }
    return inventory;
}
