#include "platform/neighbor_table.hpp"

#include <giomm.h>
#include <glibmm.h>

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

int main() {
    Gio::init();

    {
        const std::string json =
            R"([{"dst":"192.168.12.57","lladdr":"AA:BB:CC:00:11:22","state":["REACHABLE"]},)"
            R"({"dst":"192.168.12.90","state":["FAILED"]},)"
            R"({"dst":"fe80::1","lladdr":"aa:bb:cc:00:11:22","router":null,"state":["STALE"]}])";
        std::vector<neighbors::NeighborEntry> entries;
        assert(neighbors::parse_ip_neigh_json(json, entries));
        assert(entries.size() == 3);
        assert(entries[0].ip_address == "192.168.12.57");
        assert(entries[0].mac_address == "aa:bb:cc:00:11:22");
        assert(entries[0].state == "REACHABLE");
        assert(entries[1].mac_address.empty());
        assert(entries[1].state == "FAILED");
        assert(entries[2].ip_address == "fe80::1");
    }

    {
        std::vector<neighbors::NeighborEntry> entries;
        assert(neighbors::parse_ip_neigh_json("[]", entries));
        assert(entries.empty());
        assert(!neighbors::parse_ip_neigh_json("not json", entries));
        assert(!neighbors::parse_ip_neigh_json(R"({"dst":"10.0.0.1"})", entries));
    }

    {
        const std::string contents =
            "1718000000 aa:bb:cc:00:11:22 192.168.12.57 pixel-7 01:aa:bb:cc:00:11:22\n"
            "1718000100 DE:AD:BE:EF:00:01 192.168.12.60 * *\n"
            "duid 00:01:00:01:2c:5f:aa:bb:cc:dd:ee:ff\n"
            "\n";
        auto leases = neighbors::parse_dnsmasq_leases(contents);
        assert(leases.size() == 2);
        assert(leases[0].hostname == "pixel-7");
        assert(leases[0].ip_address == "192.168.12.57");
        assert(leases[1].mac_address == "de:ad:be:ef:00:01");
        assert(leases[1].hostname.empty());
    }

    {
        std::vector<neighbors::NeighborEntry> entries = {
            {"fe80::1", "aa:bb:cc:00:11:22", "STALE"},
            {"192.168.12.57", "aa:bb:cc:00:11:22", "REACHABLE"},
            {"192.168.12.90", "", "FAILED"},
            {"192.168.12.91", "11:22:33:44:55:66", "INCOMPLETE"},
            {"192.168.12.60", "de:ad:be:ef:00:01", "DELAY"},
        };
        std::vector<neighbors::LeaseEntry> leases = {
            {"aa:bb:cc:00:11:22", "192.168.12.57", "pixel-7"},
            {"99:99:99:99:99:99", "192.168.12.70", "laptop"},
        };

        auto devices = neighbors::merge_devices(entries, true, leases);
        assert(devices.size() == 2);
        assert(devices[0].mac_address == "aa:bb:cc:00:11:22");
        assert(devices[0].ip_address == "192.168.12.57");
        assert(devices[0].hostname == "pixel-7");
        assert(devices[1].ip_address == "192.168.12.60");
        assert(devices[1].hostname.empty());
    }

    {
        // Without a neighbor table the lease file is the device list.
        std::vector<neighbors::LeaseEntry> leases = {
            {"aa:bb:cc:00:11:22", "192.168.12.57", "pixel-7"},
            {"99:99:99:99:99:99", "192.168.12.70", ""},
        };
        auto devices = neighbors::merge_devices({}, false, leases);
        assert(devices.size() == 2);
        assert(devices[1].mac_address == "99:99:99:99:99:99");

        assert(neighbors::merge_devices({}, true, leases).empty());
    }

    {
        NeighborBackend backend;
        assert(backend.read_leases("/nonexistent/idkspot/dnsmasq.leases").empty());
        assert(backend.read_leases("").empty());
    }

    {
        NeighborBackend backend;
        bool called = false;
        std::string name = "unset";
        backend.resolve_hostname_async("not-an-address", [&](const std::string& resolved) {
            called = true;
            name = resolved;
        });
        assert(called);
        assert(name.empty());
    }

    {
        // Lookups complete from the main context, never inside the call.
        NeighborBackend backend;
        bool called = false;
        backend.resolve_hostname_async("127.0.0.1", [&called](const std::string&) { called = true; });
        assert(!called);

        auto context = Glib::MainContext::get_default();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!called && std::chrono::steady_clock::now() < deadline) {
            if (!context->iteration(false)) {
                g_usleep(5 * 1000);
            }
        }
        assert(called);
    }

    return 0;
}
