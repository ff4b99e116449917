#include "ui/devices_panel.hpp"

#include <string>

namespace ui {
DevicesPanel::DevicesPanel(
    const Glib::RefPtr<Gio::ListStore<DeviceItem>>& device_store,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_device_cell,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_ip,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_mac,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_device_hostname) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    m_title = Gtk::make_managed<Gtk::Label>("Connected Devices");
    m_title->add_css_class("heading");
    m_title->set_halign(Gtk::Align::START);
    m_root->append(*m_title);

    auto selectionModel = Gtk::NoSelection::create(device_store);
    auto columnView = Gtk::make_managed<Gtk::ColumnView>();
    columnView->set_model(selectionModel);
    columnView->add_css_class("data-table");

    auto factory_ip = Gtk::SignalListItemFactory::create();
    factory_ip->signal_setup().connect(setup_device_cell);
    factory_ip->signal_bind().connect(bind_device_ip);
    auto col_ip = Gtk::ColumnViewColumn::create("IP Address", factory_ip);
    col_ip->set_fixed_width(140);
    columnView->append_column(col_ip);

    auto factory_mac = Gtk::SignalListItemFactory::create();
    factory_mac->signal_setup().connect(setup_device_cell);
    factory_mac->signal_bind().connect(bind_device_mac);
    auto col_mac = Gtk::ColumnViewColumn::create("MAC Address", factory_mac);
    col_mac->set_fixed_width(160);
    columnView->append_column(col_mac);

    auto factory_hostname = Gtk::SignalListItemFactory::create();
    factory_hostname->signal_setup().connect(setup_device_cell);
    factory_hostname->signal_bind().connect(bind_device_hostname);
    auto col_hostname = Gtk::ColumnViewColumn::create("Hostname", factory_hostname);
    col_hostname->set_expand(true);
    columnView->append_column(col_hostname);

    auto scroll = Gtk::make_managed<Gtk::ScrolledWindow>();
    scroll->set_child(*columnView);
    scroll->set_policy(Gtk::PolicyType::NEVER, Gtk::PolicyType::AUTOMATIC);
    scroll->set_min_content_height(120);
    scroll->set_vexpand(true);
    m_root->append(*scroll);
}

Gtk::Box* DevicesPanel::widget() const {
    return m_root;
}

void DevicesPanel::set_device_count(guint count) {
    m_title->set_text(count == 0 ? "Connected Devices"
                                 : "Connected Devices (" + std::to_string(count) + ")");
}
}  // namespace ui
