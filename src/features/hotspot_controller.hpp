#ifndef HOTSPOT_CONTROLLER_HPP
#define HOTSPOT_CONTROLLER_HPP

#include "core/errors.hpp"
#include "core/models.hpp"
#include "platform/helper_process.hpp"
#include "platform/neighbor_table.hpp"

#include <glibmm.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hotspot {
std::optional<HotspotError> validate_config(const HotspotConfig& config,
                                            const std::vector<WirelessInterface>& interfaces);

std::vector<std::string> build_helper_argv(const std::string& elevation_program,
                                           const std::string& helper_path,
                                           const HotspotConfig& config);
std::vector<std::string> build_stop_argv(const std::string& elevation_program,
                                         const std::string& helper_path,
                                         const std::string& interface_name);

// pkexec exits 126 when the dialog is dismissed and 127 when authorization fails.
bool is_permission_denied(const std::string& elevation_program, int exit_code,
                          const std::string& output);

std::string parse_virtual_interface(const std::string& line);
std::string parse_config_dir(const std::string& line);
}

// Owns at most one hotspot session and the helper process behind it.
class HotspotController {
public:
    explicit HotspotController(AppSettings settings = AppSettings(),
                               NeighborBackend neighbor_backend = NeighborBackend());
    ~HotspotController();

    HotspotController(const HotspotController&) = delete;
    HotspotController& operator=(const HotspotController&) = delete;

    void set_interfaces(std::vector<WirelessInterface> interfaces);
    const std::vector<WirelessInterface>& interfaces() const { return m_interfaces; }

    Result<SessionHandle> start(const HotspotConfig& config);
    std::optional<HotspotError> stop(SessionHandle handle);
    SessionState status(SessionHandle handle) const;
    Result<std::vector<ConnectedDevice>> connected_devices(SessionHandle handle) const;

    // True while the session's helper process has not been reaped, even when Failed.
    bool helper_alive(SessionHandle handle) const;
    SessionHandle current_session() const;
    std::optional<std::chrono::system_clock::time_point> started_at(SessionHandle handle) const;
    std::string ap_interface(SessionHandle handle) const;
    const std::optional<HotspotError>& last_error() const { return m_last_error; }

    sigc::signal<void(SessionState)>& signal_state_changed() { return m_signal_state_changed; }

private:
    struct Session {
        SessionHandle handle;
        SessionState state = SessionState::Stopped;
        std::chrono::system_clock::time_point started_at;
        std::string wifi_interface;
        std::string ap_interface;
        std::string config_dir;
        std::unique_ptr<HelperProcess> process;
    };

    void on_helper_line(const std::string& line);
    void on_helper_exit(int wait_status);
    bool on_start_timeout();
    bool on_stop_grace_elapsed();
    void on_stop_command_exit(int wait_status);

    bool request_termination();
    void fail(HotspotError error);
    void set_state(SessionState state);
    void release_session();
    void retire(std::unique_ptr<HelperProcess> process);
    bool reap_retired();
    std::string lease_file_for(const Session& session) const;
    std::string cached_hostname(const std::string& ip_address) const;

    AppSettings m_settings;
    NeighborBackend m_neighbor_backend;
    std::vector<WirelessInterface> m_interfaces;

    std::unique_ptr<Session> m_session;
    std::string m_helper_path;
    std::uint64_t m_next_session_id = 1;
    std::optional<HotspotError> m_last_error;

    // ip -> reverse DNS name, empty while pending or unresolvable.
    using HostnameCache = std::map<std::string, std::string>;
    std::shared_ptr<HostnameCache> m_hostnames = std::make_shared<HostnameCache>();

    std::unique_ptr<HelperProcess> m_stop_process;
    std::vector<std::unique_ptr<HelperProcess>> m_retired;

    sigc::connection m_start_timeout;
    sigc::connection m_stop_timer;
    sigc::connection m_reap_idle;
    sigc::signal<void(SessionState)> m_signal_state_changed;
};

#endif
