#include "hotspot_window.hpp"

#include "config_io.hpp"
#include "platform/iw_backend.hpp"
#include "ui/devices_panel.hpp"

#include <iostream>

namespace {
bool session_active(SessionState state) {
    return state == SessionState::Starting || state == SessionState::Running ||
           state == SessionState::Stopping;
}

bool session_stoppable(SessionState state, bool helper_alive) {
    return state == SessionState::Starting || state == SessionState::Running ||
           (state == SessionState::Failed && helper_alive);
}

std::string channel_text(const WirelessInterface& iface) {
    if (iface.channel == 0) {
        return "Channel unknown (not connected?)";
    }
    return "Channel " + std::to_string(iface.channel) + " (" + std::to_string(iface.frequency_mhz) + " MHz)";
}
}

void HotspotWindow::detect_interfaces() {
    m_HardwareReady = false;
    m_Interfaces.clear();

    auto detected = m_Detector.detect();
    if (auto* error = std::get_if<HotspotError>(&detected)) {
        m_Controller.set_interfaces({});
        m_HardwareLabel.set_text("⚠ " + error->message);
        m_HardwareLabel.remove_css_class("success");
        m_HardwareLabel.add_css_class("warning");
        m_CompatLabel.set_text("");
        m_InterfaceModel = Gtk::StringList::create({});
        m_InterfaceDropDown.set_model(m_InterfaceModel);
        m_ChannelLabel.set_text("");
        update_controls();
        return;
    }

    m_Interfaces = std::get<std::vector<WirelessInterface>>(detected);
    m_Controller.set_interfaces(m_Interfaces);

    std::vector<Glib::ustring> names;
    for (const auto& iface : m_Interfaces) {
        names.push_back(iface.name);
    }
    m_InterfaceModel = Gtk::StringList::create(names);
    m_InterfaceDropDown.set_model(m_InterfaceModel);

    auto selected = iw::select_interface(m_Interfaces, m_Settings.interface_name);
    if (auto* iface = std::get_if<WirelessInterface>(&selected)) {
        for (guint i = 0; i < m_Interfaces.size(); ++i) {
            if (m_Interfaces[i].name == iface->name) {
                m_InterfaceDropDown.set_selected(i);
            }
        }
    } else {
        m_InterfaceDropDown.set_selected(0);
    }

    on_interface_selected();
}

const WirelessInterface* HotspotWindow::selected_interface() const {
    const guint index = m_InterfaceDropDown.get_selected();
    if (index == GTK_INVALID_LIST_POSITION || index >= m_Interfaces.size()) {
        return nullptr;
    }
    return &m_Interfaces[index];
}

void HotspotWindow::on_interface_selected() {
    const WirelessInterface* iface = selected_interface();
    if (!iface) {
        m_HardwareReady = false;
        m_ChannelLabel.set_text("");
        update_controls();
        return;
    }

    m_HardwareReady = iface->supports_ap_managed;
    if (m_HardwareReady) {
        m_HardwareLabel.set_text("✓ Compatible");
        m_HardwareLabel.remove_css_class("warning");
        m_HardwareLabel.remove_css_class("error");
        m_HardwareLabel.add_css_class("success");
        m_CompatLabel.set_text("Simultaneous AP+Managed mode supported");
    } else {
        m_HardwareLabel.set_text("✗ Hardware Not Supported");
        m_HardwareLabel.remove_css_class("success");
        m_HardwareLabel.add_css_class("error");
        m_CompatLabel.set_text(iface->name + " cannot run an access point while connected as a client");
    }
    m_ChannelLabel.set_text(channel_text(*iface));
    update_controls();
}

void HotspotWindow::on_button_toggle() {
    const SessionState state = m_Controller.status(m_Session);
    if (session_stoppable(state, m_Controller.helper_alive(m_Session))) {
        if (auto error = m_Controller.stop(m_Session)) {
            set_status_message(error->describe(), true);
        }
        return;
    }

    const WirelessInterface* iface = selected_interface();
    HotspotConfig config;
    config.ssid = m_SsidEntry.get_text();
    config.passphrase = m_PasswordEntry.get_text();
    config.interface_name = iface ? iface->name : "";
    config.channel = m_Settings.channel;

    m_ActiveSsid = config.ssid;
    auto started = m_Controller.start(config);
    if (auto* error = std::get_if<HotspotError>(&started)) {
        set_status_message("Error: " + error->describe(), true);
        update_controls();
        return;
    }

    m_Session = std::get<SessionHandle>(started);
    m_Settings.ssid = config.ssid;
    m_Settings.interface_name = config.interface_name;
    save_settings();
}

void HotspotWindow::on_session_state_changed(SessionState state) {
    // Emitted from inside start(), before its handle is returned.
    if (state == SessionState::Starting) {
        m_Session = m_Controller.current_session();
    }

    const WirelessInterface* iface = selected_interface();
    const std::string channel = iface && iface->channel != 0 ? std::to_string(iface->channel) : "auto";

    switch (state) {
        case SessionState::Starting:
            set_status_message("Hotspot '" + m_ActiveSsid + "' starting on channel " + channel + "...", false);
            break;
        case SessionState::Running:
            set_status_message("Hotspot '" + m_ActiveSsid + "' running on " +
                                   m_Controller.ap_interface(m_Session), false);
            m_DevicesTimer.disconnect();
            m_DevicesTimer = Glib::signal_timeout().connect(
                sigc::mem_fun(*this, &HotspotWindow::refresh_devices),
                static_cast<unsigned int>(m_Settings.devices_refresh_interval.count()));
            refresh_devices();
            break;
        case SessionState::Stopping:
            set_status_message("Stopping hotspot...", false);
            break;
        case SessionState::Stopped:
            set_status_message("Hotspot stopped", false);
            break;
        case SessionState::Failed:
            if (const auto& error = m_Controller.last_error()) {
                set_status_message("Error: " + error->describe(), true);
            } else {
                set_status_message("Error: hotspot failed", true);
            }
            break;
    }

    if (state != SessionState::Running) {
        m_DevicesTimer.disconnect();
        m_DeviceStore->remove_all();
        m_DevicesPanel->set_device_count(0);
    }
    update_controls();
}

void HotspotWindow::update_controls() {
    const SessionState state = m_Controller.status(m_Session);
    const bool helper_alive = m_Controller.helper_alive(m_Session);
    const bool active = session_active(state) || helper_alive;

    m_SsidEntry.set_sensitive(!active);
    m_PasswordEntry.set_sensitive(!active);
    m_InterfaceDropDown.set_sensitive(!active);
    m_Button_Refresh.set_sensitive(!active);

    if (session_stoppable(state, helper_alive)) {
        m_Button_Toggle.set_label("Stop Hotspot");
        m_Button_Toggle.remove_css_class("suggested-action");
        m_Button_Toggle.add_css_class("destructive-action");
        m_Button_Toggle.set_sensitive(true);
    } else {
        m_Button_Toggle.set_label("Start Hotspot");
        m_Button_Toggle.remove_css_class("destructive-action");
        m_Button_Toggle.add_css_class("suggested-action");
        m_Button_Toggle.set_sensitive(state != SessionState::Stopping && m_HardwareReady);
    }
}

void HotspotWindow::save_settings() {
    if (!ConfigIO::saveSettings(m_SettingsPath, m_Settings)) {
        std::cerr << "Warning: settings were not saved\n";
    }
}
