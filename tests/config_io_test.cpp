#include "config_io.hpp"

#include <glib/gstdio.h>
#include <glibmm.h>

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

namespace {
std::string make_temp_dir() {
    GError* error = nullptr;
    gchar* path = g_dir_make_tmp("idkspot-config-XXXXXX", &error);
    assert(path != nullptr);
    std::string dir(path);
    g_free(path);
    return dir;
}
}

int main() {
    Glib::init();
    const std::string dir = make_temp_dir();

    {
        AppSettings settings = ConfigIO::loadSettings(Glib::build_filename(dir, "missing.conf"));
        assert(settings.ssid == "idkspot");
        assert(settings.helper_program == "create_ap");
        assert(settings.elevation_program == "pkexec");
        assert(settings.ready_marker == "AP-ENABLED");
        assert(settings.start_timeout.count() == 20000);
        assert(settings.stop_grace.count() == 5000);
        assert(settings.resolve_hostnames);
    }

    {
        const std::string path = Glib::build_filename(dir, "nested", "idkspot.conf");
        AppSettings settings;
        settings.ssid = "Cafe Hotspot";
        settings.interface_name = "wlp2s0";
        settings.channel = 11;
        settings.start_timeout = std::chrono::milliseconds(15000);
        settings.resolve_hostnames = false;
        assert(ConfigIO::saveSettings(path, settings));

        AppSettings loaded = ConfigIO::loadSettings(path);
        assert(loaded.ssid == "Cafe Hotspot");
        assert(loaded.interface_name == "wlp2s0");
        assert(loaded.channel == 11);
        assert(loaded.start_timeout.count() == 15000);
        assert(!loaded.resolve_hostnames);
        assert(loaded.leases_file == settings.leases_file);
        g_remove(path.c_str());
        g_rmdir(Glib::path_get_dirname(path).c_str());
    }

    {
        // Bad values fall back to defaults instead of failing the load.
        const std::string path = Glib::build_filename(dir, "partial.conf");
        Glib::file_set_contents(path,
                                "[hotspot]\n"
                                "ssid=Garage\n"
                                "channel=eleven\n"
                                "[helper]\n"
                                "program=\n"
                                "start_timeout_ms=0\n"
                                "stop_grace_ms=-5\n"
                                "[devices]\n"
                                "refresh_interval_ms=0\n");

        std::ostringstream warnings;
        std::streambuf* previous = std::cerr.rdbuf(warnings.rdbuf());
        AppSettings loaded = ConfigIO::loadSettings(path);
        std::cerr.rdbuf(previous);

        assert(warnings.str().find("channel") != std::string::npos);
        assert(warnings.str().find("start_timeout_ms") != std::string::npos);
        assert(warnings.str().find("stop_grace_ms") != std::string::npos);
        assert(warnings.str().find("refresh_interval_ms") != std::string::npos);
        assert(loaded.start_timeout.count() == 20000);
        assert(loaded.ssid == "Garage");
        assert(loaded.channel == 0);
        assert(loaded.helper_program == "create_ap");
        assert(loaded.stop_grace.count() == 5000);
        assert(loaded.devices_refresh_interval.count() == 3000);
        g_remove(path.c_str());
    }

    g_rmdir(dir.c_str());
    return 0;
}
