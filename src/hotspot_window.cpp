#include "hotspot_window.hpp"

#include "config_io.hpp"
#include "ui/devices_panel.hpp"

HotspotWindow::HotspotWindow()
: m_MainVBox(Gtk::Orientation::VERTICAL),
  m_SettingsPath(ConfigIO::defaultPath()),
  m_Settings(ConfigIO::loadSettings(m_SettingsPath)),
  m_Controller(m_Settings)
{
    set_title("idkspot");
    set_default_size(480, 520);

    set_titlebar(m_HeaderBar);
    m_HeaderBar.set_show_title_buttons(true);

    m_Button_Refresh.set_icon_name("view-refresh-symbolic");
    m_Button_Refresh.set_tooltip_text("Detect Wireless Interfaces");
    m_Button_Refresh.signal_clicked().connect(sigc::mem_fun(*this, &HotspotWindow::on_button_refresh));
    m_HeaderBar.pack_start(m_Button_Refresh);

    set_child(m_MainVBox);
    m_MainVBox.set_margin(18);
    m_MainVBox.set_spacing(14);

    m_StatusGrid.set_row_spacing(6);
    m_StatusGrid.set_column_spacing(12);

    auto hardwareTitle = Gtk::make_managed<Gtk::Label>("Hardware Status:");
    hardwareTitle->set_halign(Gtk::Align::START);
    m_HardwareLabel.set_halign(Gtk::Align::START);
    m_StatusGrid.attach(*hardwareTitle, 0, 0);
    m_StatusGrid.attach(m_HardwareLabel, 1, 0);

    m_CompatLabel.set_halign(Gtk::Align::START);
    m_CompatLabel.add_css_class("dim-label");
    m_CompatLabel.set_wrap(true);
    m_StatusGrid.attach(m_CompatLabel, 0, 1, 2, 1);

    auto interfaceTitle = Gtk::make_managed<Gtk::Label>("Interface:");
    interfaceTitle->set_halign(Gtk::Align::START);
    m_InterfaceModel = Gtk::StringList::create({});
    m_InterfaceDropDown.set_model(m_InterfaceModel);
    m_InterfaceDropDown.property_selected().signal_changed().connect(
        sigc::mem_fun(*this, &HotspotWindow::on_interface_selected));
    m_StatusGrid.attach(*interfaceTitle, 0, 2);
    m_StatusGrid.attach(m_InterfaceDropDown, 1, 2);

    m_ChannelLabel.set_halign(Gtk::Align::START);
    m_ChannelLabel.add_css_class("dim-label");
    m_StatusGrid.attach(m_ChannelLabel, 1, 3);
    m_MainVBox.append(m_StatusGrid);

    m_MainVBox.append(*Gtk::make_managed<Gtk::Separator>(Gtk::Orientation::HORIZONTAL));

    m_InputGrid.set_row_spacing(12);
    m_InputGrid.set_column_spacing(15);

    auto ssidTitle = Gtk::make_managed<Gtk::Label>("SSID:");
    ssidTitle->set_halign(Gtk::Align::START);
    m_SsidEntry.set_hexpand(true);
    m_SsidEntry.set_max_length(32);
    m_SsidEntry.set_text(m_Settings.ssid);
    m_InputGrid.attach(*ssidTitle, 0, 0);
    m_InputGrid.attach(m_SsidEntry, 1, 0);

    auto passwordTitle = Gtk::make_managed<Gtk::Label>("Password:");
    passwordTitle->set_halign(Gtk::Align::START);
    m_PasswordEntry.set_hexpand(true);
    m_PasswordEntry.set_show_peek_icon(true);
    m_InputGrid.attach(*passwordTitle, 0, 1);
    m_InputGrid.attach(m_PasswordEntry, 1, 1);
    m_MainVBox.append(m_InputGrid);

    m_Button_Toggle.set_label("Start Hotspot");
    m_Button_Toggle.set_halign(Gtk::Align::CENTER);
    m_Button_Toggle.set_size_request(200, 42);
    m_Button_Toggle.add_css_class("suggested-action");
    m_Button_Toggle.signal_clicked().connect(sigc::mem_fun(*this, &HotspotWindow::on_button_toggle));
    m_MainVBox.append(m_Button_Toggle);

    m_StatusLabel.set_halign(Gtk::Align::CENTER);
    m_StatusLabel.set_wrap(true);
    m_StatusLabel.set_selectable(true);
    m_MainVBox.append(m_StatusLabel);

    m_DeviceStore = Gio::ListStore<DeviceItem>::create();
    m_DevicesPanel = std::make_unique<ui::DevicesPanel>(
        m_DeviceStore,
        sigc::mem_fun(*this, &HotspotWindow::setup_device_cell),
        sigc::mem_fun(*this, &HotspotWindow::bind_device_ip),
        sigc::mem_fun(*this, &HotspotWindow::bind_device_mac),
        sigc::mem_fun(*this, &HotspotWindow::bind_device_hostname));
    m_MainVBox.append(*m_DevicesPanel->widget());

    m_Controller.signal_state_changed().connect(
        sigc::mem_fun(*this, &HotspotWindow::on_session_state_changed));

    detect_interfaces();
}

HotspotWindow::~HotspotWindow() {
    m_DevicesTimer.disconnect();
}

void HotspotWindow::on_button_refresh() {
    detect_interfaces();
}

void HotspotWindow::set_status_message(const std::string& text, bool is_error) {
    m_StatusLabel.set_text(text);
    if (is_error) {
        m_StatusLabel.remove_css_class("success");
        m_StatusLabel.add_css_class("error");
    } else {
        m_StatusLabel.remove_css_class("error");
        m_StatusLabel.add_css_class("success");
    }
}
