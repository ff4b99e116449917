#ifndef UI_ITEM_MODELS_HPP
#define UI_ITEM_MODELS_HPP

#include "core/models.hpp"

#include <gtkmm.h>

#include <string>

namespace ui {
class DeviceItem : public Glib::Object {
public:
    std::string m_ipAddress;
    std::string m_macAddress;
    std::string m_hostname;

    static Glib::RefPtr<DeviceItem> create(const ConnectedDevice& device) {
        return Glib::make_refptr_for_instance<DeviceItem>(
            new DeviceItem(device.ip_address, device.mac_address, device.hostname));
    }

protected:
    DeviceItem(const std::string& ipAddress, const std::string& macAddress,
               const std::string& hostname)
        : m_ipAddress(ipAddress), m_macAddress(macAddress), m_hostname(hostname) {}
};
}  // namespace ui

#endif
