#include "features/hotspot_controller.hpp"

#include "platform/command.hpp"
#include "platform/iw_backend.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>
#include <regex>
#include <unistd.h>
#include <utility>

namespace {
constexpr size_t kMaxSsidBytes = 32;
constexpr size_t kMinPassphraseLength = 8;
constexpr size_t kMaxPassphraseLength = 63;

const WirelessInterface* find_interface(const std::vector<WirelessInterface>& interfaces,
                                        const std::string& name) {
    auto it = std::find_if(interfaces.begin(), interfaces.end(),
                           [&name](const WirelessInterface& iface) { return iface.name == name; });
    return it == interfaces.end() ? nullptr : &*it;
}

std::string status_text(int wait_status) {
    const int code = HelperProcess::exit_code(wait_status);
    if (HelperProcess::exited_normally(wait_status)) {
        return "status " + std::to_string(code);
    }
    return "signal " + std::to_string(code - 128);
}
}

std::optional<HotspotError> hotspot::validate_config(const HotspotConfig& config,
                                                     const std::vector<WirelessInterface>& interfaces) {
    if (config.ssid.empty()) {
        return HotspotError(ErrorKind::Validation, "SSID cannot be empty");
    }
    if (config.ssid.size() > kMaxSsidBytes) {
        return HotspotError(ErrorKind::Validation, "SSID must be at most 32 bytes");
    }
    if (config.passphrase.size() < kMinPassphraseLength) {
        return HotspotError(ErrorKind::Validation, "Password must be at least 8 characters");
    }
    if (config.passphrase.size() > kMaxPassphraseLength) {
        return HotspotError(ErrorKind::Validation, "Password must be at most 63 characters");
    }
    if (config.interface_name.empty()) {
        return HotspotError(ErrorKind::Validation, "No wireless interface selected");
    }

    const WirelessInterface* iface = find_interface(interfaces, config.interface_name);
    if (!iface) {
        return HotspotError(ErrorKind::Validation, "Unknown wireless interface " + config.interface_name);
    }
    if (!iface->supports_ap_managed) {
        return HotspotError(ErrorKind::Validation,
                            iface->name + " does not support simultaneous AP+Managed mode");
    }

    if (config.channel == 0 && iface->channel != 0 && !iw::is_valid_channel(iface->channel)) {
        return HotspotError(ErrorKind::Validation,
                            iface->name + " is connected on channel " + std::to_string(iface->channel) +
                                ", which cannot host an access point");
    }
    if (config.channel != 0) {
        if (!iw::is_valid_channel(config.channel)) {
            return HotspotError(ErrorKind::Validation, "Invalid channel " + std::to_string(config.channel));
        }
        if (iface->channel != 0 && iface->channel != config.channel) {
            return HotspotError(ErrorKind::Validation,
                                iface->name + " is connected on channel " + std::to_string(iface->channel) +
                                    ", the hotspot must use the same channel");
        }
    }

    return std::nullopt;
}

std::vector<std::string> hotspot::build_helper_argv(const std::string& elevation_program,
                                                    const std::string& helper_path,
                                                    const HotspotConfig& config) {
    std::vector<std::string> argv;
    if (!elevation_program.empty()) {
        argv.push_back(elevation_program);
    }
    argv.push_back(helper_path);
    if (config.channel != 0) {
        argv.push_back("-c");
        argv.push_back(std::to_string(config.channel));
    }
    argv.push_back(config.interface_name);
    argv.push_back(config.internet_interface.empty() ? config.interface_name : config.internet_interface);
    argv.push_back(config.ssid);
    argv.push_back(config.passphrase);
    return argv;
}

std::vector<std::string> hotspot::build_stop_argv(const std::string& elevation_program,
                                                  const std::string& helper_path,
                                                  const std::string& interface_name) {
    std::vector<std::string> argv;
    if (!elevation_program.empty()) {
        argv.push_back(elevation_program);
    }
    argv.push_back(helper_path);
    argv.push_back("--stop");
    argv.push_back(interface_name);
    return argv;
}

bool hotspot::is_permission_denied(const std::string& elevation_program, int exit_code,
                                   const std::string& output) {
    if (elevation_program.empty() || Glib::path_get_basename(elevation_program) != "pkexec") {
        return false;
    }
    if (exit_code != 126 && exit_code != 127) {
        return false;
    }
    return output.find("Cannot run program") == std::string::npos;
}

std::string hotspot::parse_virtual_interface(const std::string& line) {
    static const std::regex created_regex(R"((\S+) created\.\s*$)");
    std::smatch match;
    if (std::regex_search(line, match, created_regex)) {
        return match[1];
    }
    return "";
}

std::string hotspot::parse_config_dir(const std::string& line) {
    static const std::regex config_dir_regex(R"(Config dir:\s*(\S+))");
    std::smatch match;
    if (std::regex_search(line, match, config_dir_regex)) {
        return match[1];
    }
    return "";
}

HotspotController::HotspotController(AppSettings settings, NeighborBackend neighbor_backend)
    : m_settings(std::move(settings)), m_neighbor_backend(std::move(neighbor_backend)) {}

HotspotController::~HotspotController() {
    m_start_timeout.disconnect();
    m_stop_timer.disconnect();
    m_reap_idle.disconnect();

    if (m_session && m_session->process && m_session->process->running()) {
        std::cerr << "Stopping hotspot on " << m_session->wifi_interface << " before exit\n";
        if (!m_settings.elevation_program.empty()) {
            std::string output;
            std::string error_output;
            auto argv = hotspot::build_stop_argv(m_settings.elevation_program, m_helper_path,
                                                 m_session->wifi_interface);
            if (!command::run_capture(argv, output, &error_output)) {
                std::cerr << "Failed to stop create_ap: " << error_output << '\n';
            }
        }
        m_session->process->send_signal(SIGTERM);
        if (!m_session->process->wait_for_exit(m_settings.stop_grace)) {
            m_session->process->send_signal(SIGKILL);
        }
    }

    // Remaining children are terminated and reaped by their destructors.
    m_session.reset();
    m_stop_process.reset();
    m_retired.clear();
}

void HotspotController::set_interfaces(std::vector<WirelessInterface> interfaces) {
    m_interfaces = std::move(interfaces);
}

Result<SessionHandle> HotspotController::start(const HotspotConfig& config) {
    if (m_session && (m_session->state == SessionState::Starting ||
                      m_session->state == SessionState::Running ||
                      m_session->state == SessionState::Stopping)) {
        return HotspotError(ErrorKind::AlreadyActive,
                            "A hotspot is already " +
                                std::string(session_state_name(m_session->state)) + " on " +
                                m_session->wifi_interface);
    }
    if (helper_alive(current_session())) {
        return HotspotError(ErrorKind::AlreadyActive,
                            "The previous " + m_settings.helper_program + " on " +
                                m_session->wifi_interface + " is still shutting down");
    }

    if (auto error = hotspot::validate_config(config, m_interfaces)) {
        return *error;
    }

    const std::string helper_path = command::find_program(m_settings.helper_program);
    if (helper_path.empty()) {
        HotspotError error(ErrorKind::Start, m_settings.helper_program + " was not found in PATH");
        m_last_error = error;
        return error;
    }
    if (!m_settings.elevation_program.empty() &&
        command::find_program(m_settings.elevation_program).empty()) {
        HotspotError error(ErrorKind::Start, m_settings.elevation_program + " was not found in PATH");
        m_last_error = error;
        return error;
    }

    HotspotConfig launch = config;
    if (launch.channel == 0) {
        // validate_config has rejected current channels create_ap cannot use.
        launch.channel = find_interface(m_interfaces, config.interface_name)->channel;
    }

    // A Failed session is kept for status reporting until the next start.
    // Its helper has exited by now, so nothing is left to escalate.
    if (m_session) {
        retire(std::move(m_session->process));
        m_session.reset();
    }
    m_stop_timer.disconnect();
    m_hostnames->clear();

    auto session = std::make_unique<Session>();
    session->handle.id = m_next_session_id++;
    session->wifi_interface = launch.interface_name;
    session->started_at = std::chrono::system_clock::now();

    std::cerr << "Starting hotspot '" << launch.ssid << "' on " << launch.interface_name
              << " channel " << launch.channel << '\n';
    try {
        session->process = std::make_unique<HelperProcess>(
            hotspot::build_helper_argv(m_settings.elevation_program, helper_path, launch),
            sigc::mem_fun(*this, &HotspotController::on_helper_line),
            sigc::mem_fun(*this, &HotspotController::on_helper_exit));
    } catch (const Glib::SpawnError& e) {
        HotspotError error(ErrorKind::Start, std::string("Could not launch ") +
                                                 m_settings.helper_program + ": " + e.what());
        m_last_error = error;
        return error;
    }

    m_helper_path = helper_path;
    m_last_error.reset();
    m_session = std::move(session);
    m_start_timeout = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &HotspotController::on_start_timeout),
        static_cast<unsigned int>(m_settings.start_timeout.count()));
    set_state(SessionState::Starting);
    return m_session->handle;
}

std::optional<HotspotError> HotspotController::stop(SessionHandle handle) {
    if (!m_session || m_session->handle != handle) {
        return std::nullopt;
    }

    switch (m_session->state) {
        case SessionState::Stopped:
        case SessionState::Stopping:
            return std::nullopt;
        case SessionState::Failed:
            if (!helper_alive(handle)) {
                m_stop_timer.disconnect();
                release_session();
                return std::nullopt;
            }
            break;
        case SessionState::Starting:
        case SessionState::Running:
            break;
    }

    m_start_timeout.disconnect();
    set_state(SessionState::Stopping);
    std::cerr << "Stopping hotspot on " << m_session->wifi_interface << '\n';

    if (!request_termination() && !m_session->process->send_signal(SIGKILL)) {
        HotspotError error(ErrorKind::Stop, "Could not signal " + m_settings.helper_program,
                           m_session->process->output_tail());
        fail(error);
        return error;
    }
    return std::nullopt;
}

SessionState HotspotController::status(SessionHandle handle) const {
    if (!m_session || m_session->handle != handle) {
        return SessionState::Stopped;
    }
    return m_session->state;
}

Result<std::vector<ConnectedDevice>> HotspotController::connected_devices(SessionHandle handle) const {
    const SessionState state = status(handle);
    if (state != SessionState::Running) {
        return HotspotError(ErrorKind::InvalidState,
                            std::string("Hotspot is not running (") + session_state_name(state) + ")");
    }

    const Session& session = *m_session;
    const std::string iface = session.ap_interface.empty() ? session.wifi_interface : session.ap_interface;

    std::vector<neighbors::NeighborEntry> entries;
    const bool neighbors_available = m_neighbor_backend.query_neighbors(iface, entries);
    const auto leases = m_neighbor_backend.read_leases(lease_file_for(session));

    auto devices = neighbors::merge_devices(entries, neighbors_available, leases);
    if (m_settings.resolve_hostnames) {
        for (auto& device : devices) {
            if (device.hostname.empty()) {
                device.hostname = cached_hostname(device.ip_address);
            }
        }
    }
    return devices;
}

std::string HotspotController::cached_hostname(const std::string& ip_address) const {
    auto cached = m_hostnames->find(ip_address);
    if (cached != m_hostnames->end()) {
        return cached->second;
    }

    // One lookup per address; the name shows up on a later refresh.
    (*m_hostnames)[ip_address] = "";
    std::weak_ptr<HostnameCache> cache = m_hostnames;
    m_neighbor_backend.resolve_hostname_async(ip_address, [cache, ip_address](const std::string& name) {
        if (auto hostnames = cache.lock()) {
            (*hostnames)[ip_address] = name;
        }
    });
    return "";
}

bool HotspotController::helper_alive(SessionHandle handle) const {
    if (!m_session || m_session->handle != handle) {
        return false;
    }
    return m_session->process && m_session->process->running();
}

SessionHandle HotspotController::current_session() const {
    return m_session ? m_session->handle : SessionHandle();
}

std::optional<std::chrono::system_clock::time_point>
HotspotController::started_at(SessionHandle handle) const {
    if (!m_session || m_session->handle != handle) {
        return std::nullopt;
    }
    return m_session->started_at;
}

std::string HotspotController::ap_interface(SessionHandle handle) const {
    if (!m_session || m_session->handle != handle) {
        return "";
    }
    return m_session->ap_interface.empty() ? m_session->wifi_interface : m_session->ap_interface;
}

void HotspotController::on_helper_line(const std::string& line) {
    std::cerr << "create_ap: " << line << '\n';
    if (!m_session) {
        return;
    }

    std::string value = hotspot::parse_virtual_interface(line);
    if (!value.empty()) {
        m_session->ap_interface = value;
    }
    value = hotspot::parse_config_dir(line);
    if (!value.empty()) {
        m_session->config_dir = value;
    }

    if (m_session->state == SessionState::Starting &&
        line.find(m_settings.ready_marker) != std::string::npos) {
        m_start_timeout.disconnect();
        std::cerr << "Hotspot running on " << ap_interface(m_session->handle) << '\n';
        set_state(SessionState::Running);
    }
}

void HotspotController::on_helper_exit(int wait_status) {
    if (!m_session || !m_session->process) {
        return;
    }

    const int code = HelperProcess::exit_code(wait_status);
    const std::string output = m_session->process->output_tail();
    m_start_timeout.disconnect();
    m_stop_timer.disconnect();
    retire(std::move(m_session->process));

    switch (m_session->state) {
        case SessionState::Starting:
            if (hotspot::is_permission_denied(m_settings.elevation_program, code, output)) {
                fail(HotspotError(ErrorKind::PermissionDenied, "Authorization was cancelled or denied",
                                  output));
            } else {
                fail(HotspotError(ErrorKind::Start,
                                  m_settings.helper_program + " exited with " + status_text(wait_status) +
                                      " before the access point came up",
                                  output));
            }
            break;
        case SessionState::Running:
            fail(HotspotError(ErrorKind::UnexpectedExit,
                              m_settings.helper_program + " exited with " + status_text(wait_status), output));
            break;
        case SessionState::Stopping:
            std::cerr << "Hotspot stopped on " << m_session->wifi_interface << '\n';
            release_session();
            break;
        case SessionState::Failed:
            // The helper is gone; observers re-read helper_alive().
            std::cerr << m_settings.helper_program << " exited after failure (" << status_text(wait_status)
                      << ")\n";
            m_signal_state_changed.emit(SessionState::Failed);
            break;
        case SessionState::Stopped:
            break;
    }
}

bool HotspotController::on_start_timeout() {
    if (!m_session || m_session->state != SessionState::Starting) {
        return false;
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_settings.start_timeout);
    fail(HotspotError(ErrorKind::Start,
                      m_settings.helper_program + " did not bring the access point up within " +
                          std::to_string(seconds.count()) + " seconds",
                      m_session->process ? m_session->process->output_tail() : ""));
    request_termination();
    return false;
}

bool HotspotController::on_stop_grace_elapsed() {
    if (!m_session || !m_session->process || !m_session->process->running()) {
        return false;
    }

    std::cerr << "Warning: " << m_settings.helper_program << " did not exit in time, killing it\n";
    if (!m_session->process->send_signal(SIGKILL) && m_session->state == SessionState::Stopping) {
        fail(HotspotError(ErrorKind::Stop,
                          m_settings.helper_program + " did not exit and could not be killed",
                          m_session->process->output_tail()));
    }
    return false;
}

void HotspotController::on_stop_command_exit(int wait_status) {
    if (!m_stop_process) {
        return;
    }

    if (HelperProcess::exit_code(wait_status) != 0) {
        std::cerr << "Failed to stop " << m_settings.helper_program << " (" << status_text(wait_status)
                  << ")\n";
    }
    retire(std::move(m_stop_process));
}

bool HotspotController::request_termination() {
    if (!m_session || !m_session->process || !m_session->process->running()) {
        return true;
    }

    // Fails with EPERM when the helper runs elevated; the stop command covers that case.
    bool requested = m_session->process->send_signal(SIGTERM);

    if (!m_settings.elevation_program.empty()) {
        if (m_stop_process && m_stop_process->running()) {
            requested = true;
        } else {
            retire(std::move(m_stop_process));
            try {
                m_stop_process = std::make_unique<HelperProcess>(
                    hotspot::build_stop_argv(m_settings.elevation_program, m_helper_path,
                                             m_session->wifi_interface),
                    [](const std::string& line) { std::cerr << "create_ap --stop: " << line << '\n'; },
                    sigc::mem_fun(*this, &HotspotController::on_stop_command_exit));
                requested = true;
            } catch (const Glib::SpawnError& e) {
                std::cerr << "Failed to run " << m_settings.elevation_program << ": " << e.what() << '\n';
            }
        }
    }

    m_stop_timer.disconnect();
    m_stop_timer = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &HotspotController::on_stop_grace_elapsed),
        static_cast<unsigned int>(m_settings.stop_grace.count()));
    return requested;
}

void HotspotController::fail(HotspotError error) {
    std::cerr << error.describe() << '\n';
    m_start_timeout.disconnect();
    m_last_error = std::move(error);
    set_state(SessionState::Failed);
}

void HotspotController::set_state(SessionState state) {
    if (!m_session || m_session->state == state) {
        return;
    }
    m_session->state = state;
    m_signal_state_changed.emit(state);
}

void HotspotController::release_session() {
    if (!m_session) {
        return;
    }
    retire(std::move(m_session->process));
    m_session.reset();
    m_signal_state_changed.emit(SessionState::Stopped);
}

void HotspotController::retire(std::unique_ptr<HelperProcess> process) {
    if (!process) {
        return;
    }
    // A retired helper no longer reports to the current session.
    process->detach();
    m_retired.push_back(std::move(process));
    if (!m_reap_idle.connected()) {
        m_reap_idle = Glib::signal_idle().connect(sigc::mem_fun(*this, &HotspotController::reap_retired));
    }
}

bool HotspotController::reap_retired() {
    // Live children keep their child watch and are dropped once reaped.
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(),
                                   [](const std::unique_ptr<HelperProcess>& process) {
                                       return !process->running();
                                   }),
                    m_retired.end());
    return false;
}

std::string HotspotController::lease_file_for(const Session& session) const {
    if (!session.config_dir.empty()) {
        const std::string path = Glib::build_filename(session.config_dir, "dnsmasq.leases");
        if (::access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return m_settings.leases_file;
}
