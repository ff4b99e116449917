#ifndef IW_BACKEND_HPP
#define IW_BACKEND_HPP

#include "core/errors.hpp"
#include "core/models.hpp"

#include <map>
#include <string>
#include <vector>

namespace iw {
struct DeviceEntry {
    std::string phy;
    std::string name;
    std::string mode;
    int frequency_mhz = 0;
};

int frequency_to_channel(int frequency_mhz);
bool is_valid_channel(int channel);

std::vector<DeviceEntry> parse_dev(const std::string& output);

// One "valid interface combinations" entry, e.g.
// "#{ managed } <= 1, #{ AP, P2P-GO } <= 1, total <= 2, #channels <= 1".
bool combination_allows_ap_managed(const std::string& combination);

// phy name -> whether any of its combinations allows AP and managed at once.
std::map<std::string, bool> parse_ap_managed_support(const std::string& output);

Result<std::vector<WirelessInterface>> build_inventory(const std::string& dev_output,
                                                       const std::string& list_output);

Result<WirelessInterface> select_interface(const std::vector<WirelessInterface>& interfaces,
                                           const std::string& preferred);
}

class IwBackend {
public:
    explicit IwBackend(std::string program = "iw");

    bool query_devices(std::string& output) const;
    bool query_phys(std::string& output) const;

private:
    std::string m_program;
};

#endif
