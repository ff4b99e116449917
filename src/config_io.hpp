#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include "core/models.hpp"

#include <glibmm.h>

#include <string>

class ConfigIO {
public:
    // $XDG_CONFIG_HOME/idkspot/idkspot.conf
    static std::string defaultPath();

    static AppSettings loadSettings(const std::string& filePath);
    static bool saveSettings(const std::string& filePath, const AppSettings& settings);

private:
    static std::string readString(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                                  const char* key, const std::string& fallback);
    static int readInteger(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                           const char* key, int fallback);
    static bool readBoolean(const Glib::RefPtr<Glib::KeyFile>& keyFile, const char* group,
                            const char* key, bool fallback);
};

#endif // CONFIG_IO_HPP
