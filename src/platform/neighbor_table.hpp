#ifndef NEIGHBOR_TABLE_HPP
#define NEIGHBOR_TABLE_HPP

#include "core/models.hpp"

#include <sigc++/sigc++.h>

#include <string>
#include <vector>

namespace neighbors {
struct NeighborEntry {
    std::string ip_address;
    std::string mac_address;
    std::string state;
};

struct LeaseEntry {
    std::string mac_address;
    std::string ip_address;
    std::string hostname;
};

// Parses `ip -j neigh` output. Returns false when the text is not a JSON array.
bool parse_ip_neigh_json(const std::string& json, std::vector<NeighborEntry>& entries);

// dnsmasq lease lines: "<expiry> <mac> <ip> <hostname|*> <client-id|*>".
std::vector<LeaseEntry> parse_dnsmasq_leases(const std::string& contents);

// One device per MAC. Neighbor entries are authoritative when available,
// leases contribute hostnames (or the device list when neighbors are unavailable).
std::vector<ConnectedDevice> merge_devices(const std::vector<NeighborEntry>& neighbor_entries,
                                           bool neighbors_available,
                                           const std::vector<LeaseEntry>& leases);
}

class NeighborBackend {
public:
    explicit NeighborBackend(std::string ip_program = "ip");

    bool query_neighbors(const std::string& interface_name,
                         std::vector<neighbors::NeighborEntry>& entries) const;
    std::vector<neighbors::LeaseEntry> read_leases(const std::string& path) const;
    using HostnameSlot = sigc::slot<void(const std::string&)>;

    // Reverse lookup on the default resolver. on_resolved receives an empty
    // name when the address has no PTR record; it runs from the main context,
    // or immediately when ip_address is not an address.
    void resolve_hostname_async(const std::string& ip_address, const HostnameSlot& on_resolved) const;

private:
    std::string m_ip_program;
};

#endif
