#include "platform/neighbor_table.hpp"

#include "platform/command.hpp"

#include <giomm.h>
#include <glibmm.h>
#include <json-glib/json-glib.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace {
std::string json_string_member(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return "";
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) {
        return "";
    }

    return json_object_get_string_member(obj, member);
}

std::string json_state_member(JsonObject* obj) {
    if (!json_object_has_member(obj, "state")) {
        return "";
    }

    JsonNode* node = json_object_get_member(obj, "state");
    if (node && JSON_NODE_HOLDS_ARRAY(node)) {
        JsonArray* states = json_node_get_array(node);
        std::string joined;
        for (guint i = 0; i < json_array_get_length(states); ++i) {
            const char* state = json_array_get_string_element(states, i);
            if (!state) {
                continue;
            }
            if (!joined.empty()) {
                joined += ",";
            }
            joined += state;
        }
        return joined;
    }
    return json_string_member(obj, "state");
}

bool is_ipv4(const std::string& address) {
    return address.find('.') != std::string::npos;
}

std::string lower_mac(std::string mac) {
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return mac;
}
}

bool neighbors::parse_ip_neigh_json(const std::string& json, std::vector<NeighborEntry>& entries) {
    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, json.c_str(), -1, &error);
    if (!parsed) {
        if (error) {
            std::cerr << "Failed to parse neighbor table: " << error->message << '\n';
            g_error_free(error);
        }
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        g_object_unref(parser);
        return false;
    }

    JsonArray* array = json_node_get_array(root);
    guint length = json_array_get_length(array);

    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!element || !JSON_NODE_HOLDS_OBJECT(element)) {
            continue;
        }

        JsonObject* obj = json_node_get_object(element);
        NeighborEntry entry;
        entry.ip_address = json_string_member(obj, "dst");
        entry.mac_address = lower_mac(json_string_member(obj, "lladdr"));
        entry.state = json_state_member(obj);
        if (entry.ip_address.empty()) {
            continue;
        }
        entries.push_back(std::move(entry));
    }

    g_object_unref(parser);
    return true;
}

std::vector<neighbors::LeaseEntry> neighbors::parse_dnsmasq_leases(const std::string& contents) {
    std::vector<LeaseEntry> leases;

    std::stringstream ss(contents);
    std::string line;
    while (std::getline(ss, line)) {
        std::stringstream fields(line);
        std::string expiry;
        LeaseEntry lease;
        if (!(fields >> expiry >> lease.mac_address >> lease.ip_address)) {
            continue;
        }
        // dnsmasq writes a "duid" line for DHCPv6 server identity.
        if (expiry == "duid") {
            continue;
        }

        fields >> lease.hostname;
        if (lease.hostname == "*") {
            lease.hostname.clear();
        }
        lease.mac_address = lower_mac(lease.mac_address);
        leases.push_back(std::move(lease));
    }

    return leases;
}

std::vector<ConnectedDevice> neighbors::merge_devices(
    const std::vector<NeighborEntry>& neighbor_entries,
    bool neighbors_available,
    const std::vector<LeaseEntry>& leases) {
    std::map<std::string, std::string> hostnames;
    for (const auto& lease : leases) {
        if (!lease.hostname.empty()) {
            hostnames[lease.mac_address] = lease.hostname;
        }
    }

    std::vector<ConnectedDevice> devices;
    std::map<std::string, size_t> index_by_mac;

    auto add = [&](const std::string& mac, const std::string& ip) {
        auto it = index_by_mac.find(mac);
        if (it != index_by_mac.end()) {
            ConnectedDevice& existing = devices[it->second];
            if (!is_ipv4(existing.ip_address) && is_ipv4(ip)) {
                existing.ip_address = ip;
            }
            return;
        }

        ConnectedDevice device;
        device.mac_address = mac;
        device.ip_address = ip;
        auto host = hostnames.find(mac);
        if (host != hostnames.end()) {
            device.hostname = host->second;
        }
        index_by_mac[mac] = devices.size();
        devices.push_back(std::move(device));
    };

    if (neighbors_available) {
        for (const auto& entry : neighbor_entries) {
            if (entry.mac_address.empty()) {
                continue;
            }
            if (entry.state.find("FAILED") != std::string::npos ||
                entry.state.find("INCOMPLETE") != std::string::npos) {
                continue;
            }
            add(entry.mac_address, entry.ip_address);
        }
    } else {
        for (const auto& lease : leases) {
            add(lease.mac_address, lease.ip_address);
        }
    }

    return devices;
}

NeighborBackend::NeighborBackend(std::string ip_program)
    : m_ip_program(std::move(ip_program)) {}

bool NeighborBackend::query_neighbors(const std::string& interface_name,
                                      std::vector<neighbors::NeighborEntry>& entries) const {
    std::string output;
    if (!command::run_capture({m_ip_program, "-j", "neigh", "show", "dev", interface_name}, output)) {
        return false;
    }
    return neighbors::parse_ip_neigh_json(output, entries);
}

std::vector<neighbors::LeaseEntry> NeighborBackend::read_leases(const std::string& path) const {
    if (path.empty() || !Glib::file_test(path, Glib::FileTest::EXISTS)) {
        return {};
    }

    try {
        return neighbors::parse_dnsmasq_leases(Glib::file_get_contents(path));
    } catch (const Glib::FileError& e) {
        std::cerr << "Warning: could not read lease file " << path << ": " << e.what() << '\n';
        return {};
    }
}

void NeighborBackend::resolve_hostname_async(const std::string& ip_address,
                                             const HostnameSlot& on_resolved) const {
    auto address = Gio::InetAddress::create(ip_address);
    if (!address) {
        on_resolved("");
        return;
    }

    auto resolver = Gio::Resolver::get_default();
    resolver->lookup_by_address_async(
        address, [resolver, ip_address, on_resolved](Glib::RefPtr<Gio::AsyncResult>& result) {
            std::string name;
            try {
                name = resolver->lookup_by_address_finish(result);
            } catch (const Glib::Error&) {
                // Clients on the hotspot subnet rarely have PTR records.
                name.clear();
            }
            on_resolved(name == ip_address ? "" : name);
        });
}
