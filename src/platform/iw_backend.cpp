#include "platform/iw_backend.hpp"

#include "platform/command.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
std::string trim_copy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(),
                             [](unsigned char ch) { return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [](unsigned char ch) { return !std::isspace(ch); }).base(),
                value.end());
    return value;
}

std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

size_t indent_of(const std::string& line) {
    size_t count = 0;
    while (count < line.size() && (line[count] == '\t' || line[count] == ' ')) {
        ++count;
    }
    return count;
}

int to_int(const std::string& digits) {
    try {
        return std::stoi(digits);
    } catch (const std::exception&) {
        return 0;
    }
}

bool is_candidate_mode(const std::string& mode) {
    return mode != "AP" && mode != "monitor";
}

struct ModeGroup {
    std::vector<std::string> modes;
    int limit = 0;

    bool contains(const std::string& mode) const {
        return std::find(modes.begin(), modes.end(), mode) != modes.end();
    }
};
}

int iw::frequency_to_channel(int frequency_mhz) {
    if (frequency_mhz == 2484) {
        return 14;
    }
    if (frequency_mhz >= 2412 && frequency_mhz <= 2472) {
        return (frequency_mhz - 2407) / 5;
    }
    if (frequency_mhz >= 5160 && frequency_mhz <= 5885) {
        return (frequency_mhz - 5000) / 5;
    }
    // 6 GHz numbering overlaps 2.4 GHz and create_ap cannot host there.
    return 0;
}

bool iw::is_valid_channel(int channel) {
    if (channel >= 1 && channel <= 14) {
        return true;
    }
    if (channel >= 36 && channel <= 64) {
        return channel % 4 == 0;
    }
    if (channel >= 100 && channel <= 144) {
        return channel % 4 == 0;
    }
    if (channel >= 149 && channel <= 165) {
        return (channel - 149) % 4 == 0;
    }
    return false;
}

std::vector<iw::DeviceEntry> iw::parse_dev(const std::string& output) {
    std::vector<DeviceEntry> entries;

    std::regex phy_regex(R"(^phy#(\d+))");
    std::regex iface_regex(R"(^\s*Interface\s+(\S+))");
    std::regex type_regex(R"(^\s*type\s+(\S+))");
    std::regex freq_regex(R"(^\s*channel\s+\d+\s+\((\d+)\s+MHz\))");

    std::string phy;
    bool in_interface = false;
    std::stringstream ss(output);
    std::string line;
    std::smatch match;
    while (std::getline(ss, line)) {
        if (std::regex_search(line, match, phy_regex)) {
            phy = "phy" + match[1].str();
            in_interface = false;
        } else if (std::regex_search(line, match, iface_regex)) {
            DeviceEntry entry;
            entry.phy = phy;
            entry.name = match[1];
            entries.push_back(std::move(entry));
            in_interface = true;
        } else if (line.find("Unnamed/non-netdev interface") != std::string::npos) {
            in_interface = false;
        } else if (!in_interface) {
            continue;
        } else if (std::regex_search(line, match, type_regex)) {
            entries.back().mode = match[1];
        } else if (std::regex_search(line, match, freq_regex)) {
            entries.back().frequency_mhz = to_int(match[1].str());
        }
    }

    return entries;
}

bool iw::combination_allows_ap_managed(const std::string& combination) {
    std::regex group_regex(R"(#\{([^}]*)\}\s*<=\s*(\d+))");
    std::regex total_regex(R"(total\s*<=\s*(\d+))");

    std::vector<ModeGroup> groups;
    for (std::sregex_iterator it(combination.begin(), combination.end(), group_regex), end;
         it != end; ++it) {
        ModeGroup group;
        group.limit = to_int((*it)[2].str());

        std::stringstream modes((*it)[1].str());
        std::string mode;
        while (std::getline(modes, mode, ',')) {
            mode = lower_copy(trim_copy(mode));
            if (!mode.empty()) {
                group.modes.push_back(mode);
            }
        }
        groups.push_back(std::move(group));
    }

    std::smatch total_match;
    if (!std::regex_search(combination, total_match, total_regex) ||
        to_int(total_match[1].str()) < 2) {
        return false;
    }

    for (size_t i = 0; i < groups.size(); ++i) {
        if (!groups[i].contains("managed")) {
            continue;
        }
        if (groups[i].contains("ap") && groups[i].limit >= 2) {
            return true;
        }
        for (size_t j = 0; j < groups.size(); ++j) {
            if (j != i && groups[j].contains("ap")) {
                return true;
            }
        }
    }
    return false;
}

std::map<std::string, bool> iw::parse_ap_managed_support(const std::string& output) {
    std::map<std::string, bool> support;

    std::regex wiphy_regex(R"(^Wiphy\s+(\S+))");

    std::string phy;
    bool in_combinations = false;
    size_t section_indent = 0;
    std::vector<std::string> combinations;

    auto flush = [&]() {
        for (const auto& combination : combinations) {
            if (!phy.empty() && combination_allows_ap_managed(combination)) {
                support[phy] = true;
            }
        }
        combinations.clear();
    };

    std::stringstream ss(output);
    std::string line;
    std::smatch match;
    while (std::getline(ss, line)) {
        if (std::regex_search(line, match, wiphy_regex)) {
            flush();
            in_combinations = false;
            phy = match[1];
            support.emplace(phy, false);
            continue;
        }

        if (line.find("valid interface combinations") != std::string::npos) {
            in_combinations = true;
            section_indent = indent_of(line);
            continue;
        }

        if (!in_combinations) {
            continue;
        }

        const std::string trimmed = trim_copy(line);
        if (trimmed.empty()) {
            continue;
        }
        if (indent_of(line) <= section_indent) {
            in_combinations = false;
            continue;
        }

        if (trimmed.front() == '*') {
            combinations.push_back(trimmed.substr(1));
        } else if (!combinations.empty()) {
            combinations.back() += " " + trimmed;
        }
    }
    flush();

    return support;
}

Result<std::vector<WirelessInterface>> iw::build_inventory(const std::string& dev_output,
                                                           const std::string& list_output) {
    const auto support = parse_ap_managed_support(list_output);

    std::vector<WirelessInterface> interfaces;
    for (const auto& entry : parse_dev(dev_output)) {
        if (!is_candidate_mode(entry.mode)) {
            continue;
        }

        WirelessInterface iface;
        iface.name = entry.name;
        iface.phy = entry.phy;
        iface.mode = entry.mode;
        iface.frequency_mhz = entry.frequency_mhz;
        iface.channel = frequency_to_channel(entry.frequency_mhz);

        auto it = support.find(entry.phy);
        iface.supports_ap_managed = it != support.end() && it->second;
        interfaces.push_back(std::move(iface));
    }

    if (interfaces.empty()) {
        return HotspotError(ErrorKind::NoInterfaceFound, "No wireless interface found");
    }
    return interfaces;
}

Result<WirelessInterface> iw::select_interface(const std::vector<WirelessInterface>& interfaces,
                                               const std::string& preferred) {
    if (interfaces.empty()) {
        return HotspotError(ErrorKind::NoInterfaceFound, "No wireless interface found");
    }

    const WirelessInterface* first_capable = nullptr;
    for (const auto& iface : interfaces) {
        if (!iface.supports_ap_managed) {
            continue;
        }
        if (!preferred.empty() && iface.name == preferred) {
            return iface;
        }
        if (!first_capable) {
            first_capable = &iface;
        }
    }

    if (!first_capable) {
        return HotspotError(ErrorKind::NoCapableHardware,
                            "AP+Managed simultaneous mode not found");
    }
    return *first_capable;
}

IwBackend::IwBackend(std::string program)
    : m_program(std::move(program)) {}

bool IwBackend::query_devices(std::string& output) const {
    return command::run_capture({m_program, "dev"}, output);
}

bool IwBackend::query_phys(std::string& output) const {
    return command::run_capture({m_program, "list"}, output);
}
