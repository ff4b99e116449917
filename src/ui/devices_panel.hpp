#ifndef UI_DEVICES_PANEL_HPP
#define UI_DEVICES_PANEL_HPP

#include "ui/item_models.hpp"

#include <gtkmm.h>

namespace ui {
class DevicesPanel {
public:
    DevicesPanel(
        const Glib::RefPtr<Gio::ListStore<DeviceItem>>& device_store,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_device_cell,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_ip,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_mac,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_hostname);

    Gtk::Box* widget() const;
    void set_device_count(guint count);

private:
    Gtk::Box* m_root = nullptr;
    Gtk::Label* m_title = nullptr;
};
}  // namespace ui

#endif
