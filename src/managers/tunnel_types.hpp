#pragma once

#include <string>
#include <map>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

// Identity of one intended connection: the profile configuration file it is
// declared in plus the profile alias. Stored under "<config_file>:<profile>".
struct Locator {
    std::string config_file;
    std::string profile;

    std::string str() const { return config_file + ":" + profile; }

    bool operator==(const Locator& o) const {
        return config_file == o.config_file && profile == o.profile;
    }
    bool operator!=(const Locator& o) const { return !(*this == o); }
};

// Remote endpoint reachable through the tunnel.
struct Forwarding {
    std::string host;
    int port = 0;

    bool operator==(const Forwarding& o) const { return host == o.host && port == o.port; }
    bool operator!=(const Forwarding& o) const { return !(*this == o); }
};

// What a tunnel should look like. Compared by content.
struct TunnelSpec {
    Locator locator;
    std::map<std::string, Forwarding> forwardings;   // alias → remote endpoint
    std::string user;
    std::string host;
    std::optional<std::string> identity_file;

    bool operator==(const TunnelSpec& o) const {
        return locator == o.locator && forwardings == o.forwardings &&
               user == o.user && host == o.host && identity_file == o.identity_file;
    }
    bool operator!=(const TunnelSpec& o) const { return !(*this == o); }

    std::string proxy() const { return user + "@" + host; }
};

enum class TunnelState {
    Open,
    Broken,   // recorded as open, but the ssh process is gone
    Closed,
};

const char* to_string(TunnelState state);
// Throws std::invalid_argument on an unknown name.
TunnelState parse_tunnel_state(const std::string& name);

// Last known state of the tunnel for one locator.
struct TunnelStatus {
    std::string id;
    TunnelState status = TunnelState::Closed;
    std::optional<int> ssh_pid;
    std::map<std::string, int> local_ports;   // alias → local port, only while open
    std::string spec_hash;                    // hash of the spec last applied

    // Placeholder for a locator with no record.
    static TunnelStatus empty() { return TunnelStatus{}; }

    bool is_open() const { return status == TunnelState::Open; }
};

// The value stored per locator: [spec, status].
using TunnelRecord = std::pair<TunnelSpec, TunnelStatus>;

// Stable content digest of a spec. Independent of forwarding insertion order.
std::string spec_hash(const TunnelSpec& spec);

// Generate a fresh opaque tunnel id ("tun-" + 8 hex digits).
std::string new_tunnel_id();

void to_json(nlohmann::json& j, const Locator& l);
void from_json(const nlohmann::json& j, Locator& l);
void to_json(nlohmann::json& j, const Forwarding& f);
void from_json(const nlohmann::json& j, Forwarding& f);
void to_json(nlohmann::json& j, const TunnelSpec& s);
void from_json(const nlohmann::json& j, TunnelSpec& s);
void to_json(nlohmann::json& j, const TunnelStatus& s);
void from_json(const nlohmann::json& j, TunnelStatus& s);
