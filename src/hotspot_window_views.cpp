#include "hotspot_window.hpp"

#include "ui/devices_panel.hpp"

void HotspotWindow::setup_device_cell(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto label = Gtk::make_managed<Gtk::Label>();
    label->set_halign(Gtk::Align::START);
    label->set_ellipsize(Pango::EllipsizeMode::END);
    list_item->set_child(*label);
}

void HotspotWindow::bind_device_ip(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<DeviceItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_ipAddress);
    }
}

void HotspotWindow::bind_device_mac(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<DeviceItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_macAddress);
    }
}

void HotspotWindow::bind_device_hostname(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<DeviceItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_hostname.empty() ? "-" : item->m_hostname);
    }
}

bool HotspotWindow::refresh_devices() {
    auto devices = m_Controller.connected_devices(m_Session);
    if (std::holds_alternative<HotspotError>(devices)) {
        m_DeviceStore->remove_all();
        m_DevicesPanel->set_device_count(0);
        return false;
    }

    const auto& list = std::get<std::vector<ConnectedDevice>>(devices);
    m_DeviceStore->remove_all();
    for (const auto& device : list) {
        m_DeviceStore->append(DeviceItem::create(device));
    }
    m_DevicesPanel->set_device_count(static_cast<guint>(list.size()));
    return true;
}
