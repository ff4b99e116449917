#include "config_io.hpp"

#include <glib/gstdio.h>

#include <iostream>

namespace {
constexpr const char* kHotspotGroup = "hotspot";
constexpr const char* kHelperGroup = "helper";
constexpr const char* kDevicesGroup = "devices";

bool has_key(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group, const char* key) {
    // KeyFile::has_key throws when the group itself is missing.
    return keyFile->has_group(group) && keyFile->has_key(group, key);
}
}  // namespace

std::string ConfigIO::defaultPath() {
    return Glib::build_filename(Glib::get_user_config_dir(), "idkspot", "idkspot.conf");
}

AppSettings ConfigIO::loadSettings(const std::string& filePath) {
    AppSettings settings;
    if (!Glib::file_test(filePath, Glib::FileTest::EXISTS)) {
        return settings;
    }

    auto keyFile = Glib::KeyFile::create();
    try {
        keyFile->load_from_file(filePath);
    } catch (const Glib::Error& e) {
        std::cerr << "Could not read settings file " << filePath << ": " << e.what() << '\n';
        return settings;
    }

    settings.ssid = readString(keyFile, kHotspotGroup, "ssid", settings.ssid);
    settings.interface_name = readString(keyFile, kHotspotGroup, "interface", settings.interface_name);
    settings.channel = readInteger(keyFile, kHotspotGroup, "channel", settings.channel);

    settings.helper_program = readString(keyFile, kHelperGroup, "program", settings.helper_program);
    settings.elevation_program = readString(keyFile, kHelperGroup, "elevation", settings.elevation_program);
    settings.ready_marker = readString(keyFile, kHelperGroup, "ready_marker", settings.ready_marker);
    settings.start_timeout = std::chrono::milliseconds(
        readInteger(keyFile, kHelperGroup, "start_timeout_ms", static_cast<int>(settings.start_timeout.count())));
    settings.stop_grace = std::chrono::milliseconds(
        readInteger(keyFile, kHelperGroup, "stop_grace_ms", static_cast<int>(settings.stop_grace.count())));

    settings.leases_file = readString(keyFile, kDevicesGroup, "leases_file", settings.leases_file);
    settings.resolve_hostnames = readBoolean(keyFile, kDevicesGroup, "resolve_hostnames",
                                             settings.resolve_hostnames);
    settings.devices_refresh_interval = std::chrono::milliseconds(
        readInteger(keyFile, kDevicesGroup, "refresh_interval_ms",
                    static_cast<int>(settings.devices_refresh_interval.count())));

    if (settings.helper_program.empty()) {
        std::cerr << "Warning: empty helper program in " << filePath << ", using create_ap\n";
        settings.helper_program = AppSettings().helper_program;
    }
    if (settings.ready_marker.empty()) {
        std::cerr << "Warning: empty ready marker in " << filePath << ", using AP-ENABLED\n";
        settings.ready_marker = AppSettings().ready_marker;
    }
    if (settings.start_timeout.count() <= 0) {
        std::cerr << "Warning: helper.start_timeout_ms must be positive, using the default\n";
        settings.start_timeout = AppSettings().start_timeout;
    }
    if (settings.stop_grace.count() <= 0) {
        std::cerr << "Warning: helper.stop_grace_ms must be positive, using the default\n";
        settings.stop_grace = AppSettings().stop_grace;
    }
    if (settings.devices_refresh_interval.count() <= 0) {
        std::cerr << "Warning: devices.refresh_interval_ms must be positive, using the default\n";
        settings.devices_refresh_interval = AppSettings().devices_refresh_interval;
    }

    return settings;
}

bool ConfigIO::saveSettings(const std::string& filePath, const AppSettings& settings) {
    const std::string directory = Glib::path_get_dirname(filePath);
    if (g_mkdir_with_parents(directory.c_str(), 0700) != 0) {
        std::cerr << "Could not create config directory: " << directory << '\n';
        return false;
    }

    auto keyFile = Glib::KeyFile::create();
    keyFile->set_string(kHotspotGroup, "ssid", settings.ssid);
    keyFile->set_string(kHotspotGroup, "interface", settings.interface_name);
    keyFile->set_integer(kHotspotGroup, "channel", settings.channel);

    keyFile->set_string(kHelperGroup, "program", settings.helper_program);
    keyFile->set_string(kHelperGroup, "elevation", settings.elevation_program);
    keyFile->set_string(kHelperGroup, "ready_marker", settings.ready_marker);
    keyFile->set_integer(kHelperGroup, "start_timeout_ms", static_cast<int>(settings.start_timeout.count()));
    keyFile->set_integer(kHelperGroup, "stop_grace_ms", static_cast<int>(settings.stop_grace.count()));

    keyFile->set_string(kDevicesGroup, "leases_file", settings.leases_file);
    keyFile->set_boolean(kDevicesGroup, "resolve_hostnames", settings.resolve_hostnames);
    keyFile->set_integer(kDevicesGroup, "refresh_interval_ms",
                         static_cast<int>(settings.devices_refresh_interval.count()));

    try {
        keyFile->save_to_file(filePath);
    } catch (const Glib::Error& e) {
        std::cerr << "Could not write settings file " << filePath << ": " << e.what() << '\n';
        return false;
    }
    return true;
}

std::string ConfigIO::readString(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                                 const char* key, const std::string& fallback) {
    if (!has_key(keyFile, group, key)) {
        return fallback;
    }
    return keyFile->get_string(group, key);
}

int ConfigIO::readInteger(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                          const char* key, int fallback) {
    if (!has_key(keyFile, group, key)) {
        return fallback;
    }
    try {
        return keyFile->get_integer(group, key);
    } catch (const Glib::KeyFileError& e) {
        std::cerr << "Warning: invalid value for " << group << "." << key << ": " << e.what() << '\n';
        return fallback;
    }
}

bool ConfigIO::readBoolean(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                           const char* key, bool fallback) {
    if (!has_key(keyFile, group, key)) {
        return fallback;
    }
    try {
        return keyFile->get_boolean(group, key);
    } catch (const Glib::KeyFileError& e) {
        std::cerr << "Warning: invalid value for " << group << "." << key << ": " << e.what() << '\n';
        return fallback;
    }
}
