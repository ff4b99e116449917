#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct WirelessInterface {
    std::string name;
    std::string phy;
    std::string mode;
    int frequency_mhz = 0;
    int channel = 0;
    bool supports_ap_managed = false;
};

struct HotspotConfig {
    std::string ssid;
    std::string passphrase;
    std::string interface_name;
    int channel = 0;
    // Empty means share the Wi-Fi interface's own uplink.
    std::string internet_interface;
};

enum class SessionState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Failed
};

inline const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Stopped: return "Stopped";
        case SessionState::Starting: return "Starting";
        case SessionState::Running: return "Running";
        case SessionState::Stopping: return "Stopping";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

struct SessionHandle {
    std::uint64_t id = 0;

    bool valid() const { return id != 0; }
    bool operator==(const SessionHandle& other) const { return id == other.id; }
    bool operator!=(const SessionHandle& other) const { return id != other.id; }
};

struct ConnectedDevice {
    std::string ip_address;
    std::string mac_address;
    std::string hostname;
};

struct AppSettings {
    std::string ssid = "idkspot";
    std::string interface_name;
    int channel = 0;

    std::string helper_program = "create_ap";
    std::string elevation_program = "pkexec";
    std::string ready_marker = "AP-ENABLED";
    std::chrono::milliseconds start_timeout{20000};
    std::chrono::milliseconds stop_grace{5000};

    std::string leases_file = "/var/lib/misc/dnsmasq.leases";
    bool resolve_hostnames = true;
    std::chrono::milliseconds devices_refresh_interval{3000};
};

#endif
