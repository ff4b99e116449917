#include "platform/iw_backend.hpp"

#include <cassert>
#include <string>
#include <variant>
#include <vector>

namespace {
const char* kIwDev =
    "phy#1\n"
    "\tInterface wlan1\n"
    "\t\tifindex 5\n"
    "\t\taddr 00:11:22:33:44:55\n"
    "\t\ttype managed\n"
    "\t\ttxpower 20.00 dBm\n"
    "phy#0\n"
    "\tUnnamed/non-netdev interface\n"
    "\t\twdev 0x2\n"
    "\t\ttype P2P-device\n"
    "\tInterface ap0\n"
    "\t\ttype AP\n"
    "\t\tchannel 6 (2437 MHz), width: 20 MHz, center1: 2437 MHz\n"
    "\tInterface wlan0\n"
    "\t\tifindex 3\n"
    "\t\tssid HomeNetwork\n"
    "\t\ttype managed\n"
    "\t\tchannel 36 (5180 MHz), width: 80 MHz, center1: 5210 MHz\n";

const char* kIwList =
    "Wiphy phy0\n"
    "\twiphy index: 0\n"
    "\tSupported interface modes:\n"
    "\t\t * managed\n"
    "\t\t * AP\n"
    "\tvalid interface combinations:\n"
    "\t\t * #{ managed } <= 1, #{ AP, P2P-client, P2P-GO } <= 1, #{ P2P-device } <= 1,\n"
    "\t\t   total <= 3, #channels <= 2\n"
    "\tHT Capability overrides:\n"
    "Wiphy phy1\n"
    "\tvalid interface combinations:\n"
    "\t\t * #{ managed, AP } <= 1,\n"
    "\t\t   total <= 1, #channels <= 1\n";
}

int main() {
    {
        assert(iw::frequency_to_channel(2412) == 1);
        assert(iw::frequency_to_channel(2437) == 6);
        assert(iw::frequency_to_channel(2472) == 13);
        assert(iw::frequency_to_channel(2484) == 14);
        assert(iw::frequency_to_channel(5180) == 36);
        assert(iw::frequency_to_channel(5825) == 165);
        assert(iw::frequency_to_channel(5955) == 0);
        assert(iw::frequency_to_channel(6115) == 0);
        assert(iw::frequency_to_channel(0) == 0);
        assert(iw::frequency_to_channel(900) == 0);
    }

    {
        assert(iw::is_valid_channel(1));
        assert(iw::is_valid_channel(14));
        assert(iw::is_valid_channel(36));
        assert(iw::is_valid_channel(149));
        assert(!iw::is_valid_channel(0));
        assert(!iw::is_valid_channel(15));
        assert(!iw::is_valid_channel(37));
        assert(!iw::is_valid_channel(150));
    }

    {
        assert(iw::combination_allows_ap_managed(
            "#{ managed } <= 1, #{ AP, P2P-client, P2P-GO } <= 1, total <= 2, #channels <= 1"));
        assert(iw::combination_allows_ap_managed("#{ managed, AP } <= 2, total <= 2, #channels <= 1"));
        assert(!iw::combination_allows_ap_managed("#{ managed, AP } <= 1, total <= 2, #channels <= 1"));
        assert(!iw::combination_allows_ap_managed("#{ managed } <= 1, #{ AP } <= 1, total <= 1"));
        assert(!iw::combination_allows_ap_managed("#{ managed } <= 2, #{ P2P-GO } <= 1, total <= 3"));
        assert(!iw::combination_allows_ap_managed("#{ managed } <= 1, #{ AP/VLAN } <= 1, total <= 2"));
        assert(!iw::combination_allows_ap_managed(""));
    }

    {
        auto entries = iw::parse_dev(kIwDev);
        assert(entries.size() == 3);
        assert(entries[0].phy == "phy1");
        assert(entries[0].name == "wlan1");
        assert(entries[0].mode == "managed");
        assert(entries[0].frequency_mhz == 0);
        assert(entries[1].name == "ap0");
        assert(entries[1].mode == "AP");
        assert(entries[2].phy == "phy0");
        assert(entries[2].name == "wlan0");
        assert(entries[2].frequency_mhz == 5180);
    }

    {
        auto support = iw::parse_ap_managed_support(kIwList);
        assert(support.size() == 2);
        assert(support["phy0"]);
        assert(!support["phy1"]);
    }

    {
        auto inventory = iw::build_inventory(kIwDev, kIwList);
        assert(error_of(inventory) == nullptr);
        const auto& interfaces = std::get<std::vector<WirelessInterface>>(inventory);
        assert(interfaces.size() == 2);
        assert(interfaces[0].name == "wlan1");
        assert(!interfaces[0].supports_ap_managed);
        assert(interfaces[0].channel == 0);
        assert(interfaces[1].name == "wlan0");
        assert(interfaces[1].phy == "phy0");
        assert(interfaces[1].supports_ap_managed);
        assert(interfaces[1].channel == 36);
    }

    {
        // Missing combination data leaves every interface incapable.
        auto inventory = iw::build_inventory(kIwDev, "");
        const auto& interfaces = std::get<std::vector<WirelessInterface>>(inventory);
        for (const auto& iface : interfaces) {
            assert(!iface.supports_ap_managed);
        }
    }

    {
        auto inventory = iw::build_inventory("phy#0\n\tInterface ap0\n\t\ttype AP\n", kIwList);
        const HotspotError* error = error_of(inventory);
        assert(error != nullptr);
        assert(error->kind == ErrorKind::NoInterfaceFound);
    }

    {
        std::vector<WirelessInterface> interfaces(3);
        interfaces[0].name = "wlan0";
        interfaces[1].name = "wlan1";
        interfaces[1].supports_ap_managed = true;
        interfaces[2].name = "wlan2";
        interfaces[2].supports_ap_managed = true;

        auto first = iw::select_interface(interfaces, "");
        assert(std::get<WirelessInterface>(first).name == "wlan1");

        auto preferred = iw::select_interface(interfaces, "wlan2");
        assert(std::get<WirelessInterface>(preferred).name == "wlan2");

        auto incapable_preference = iw::select_interface(interfaces, "wlan0");
        assert(std::get<WirelessInterface>(incapable_preference).name == "wlan1");

        interfaces[1].supports_ap_managed = false;
        interfaces[2].supports_ap_managed = false;
        auto none = iw::select_interface(interfaces, "");
        assert(error_of(none)->kind == ErrorKind::NoCapableHardware);

        auto empty = iw::select_interface({}, "");
        assert(error_of(empty)->kind == ErrorKind::NoInterfaceFound);
    }

    return 0;
}
