#ifndef HOTSPOT_WINDOW_HPP
#define HOTSPOT_WINDOW_HPP

#include "features/capability_detector.hpp"
#include "features/hotspot_controller.hpp"
#include "ui/item_models.hpp"

#include <gtkmm.h>

#include <memory>
#include <string>
#include <vector>

namespace ui {
class DevicesPanel;
}

class HotspotWindow : public Gtk::Window
{
public:
    using DeviceItem = ui::DeviceItem;

    HotspotWindow();
    virtual ~HotspotWindow();

protected:
    void on_button_refresh();
    void on_button_toggle();
    void on_interface_selected();
    void on_session_state_changed(SessionState state);

    Gtk::HeaderBar m_HeaderBar;
    Gtk::Box m_MainVBox;
    Gtk::Grid m_StatusGrid;
    Gtk::Label m_HardwareLabel;
    Gtk::Label m_CompatLabel;
    Gtk::DropDown m_InterfaceDropDown;
    Gtk::Label m_ChannelLabel;
    Gtk::Grid m_InputGrid;
    Gtk::Entry m_SsidEntry;
    Gtk::PasswordEntry m_PasswordEntry;
    Gtk::Button m_Button_Toggle;
    Gtk::Button m_Button_Refresh;
    Gtk::Label m_StatusLabel;

    Glib::RefPtr<Gtk::StringList> m_InterfaceModel;
    Glib::RefPtr<Gio::ListStore<DeviceItem>> m_DeviceStore;
    std::unique_ptr<ui::DevicesPanel> m_DevicesPanel;

    std::string m_SettingsPath;
    AppSettings m_Settings;
    CapabilityDetector m_Detector;
    HotspotController m_Controller;
    std::vector<WirelessInterface> m_Interfaces;
    bool m_HardwareReady = false;
    SessionHandle m_Session;
    std::string m_ActiveSsid;
    sigc::connection m_DevicesTimer;

    void setup_device_cell(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_device_ip(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_device_mac(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_device_hostname(const Glib::RefPtr<Gtk::ListItem>& list_item);

    void detect_interfaces();
    const WirelessInterface* selected_interface() const;
    bool refresh_devices();
    void update_controls();
    void save_settings();
    void set_status_message(const std::string& text, bool is_error);
};

#endif
