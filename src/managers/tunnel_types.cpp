#include "tunnel_types.hpp"
#include <core/digest.hpp>
#include <random>
#include <cstdint>
#include <stdexcept>
#include <fmt/format.h>

const char* to_string(TunnelState state) {
    switch (state) {
        case TunnelState::Open:   return "open";
        case TunnelState::Broken: return "broken";
        case TunnelState::Closed: return "closed";
    }
    return "closed";
}

TunnelState parse_tunnel_state(const std::string& name) {
    if (name == "open") return TunnelState::Open;
    if (name == "broken") return TunnelState::Broken;
    if (name == "closed") return TunnelState::Closed;
    throw std::invalid_argument(fmt::format("Unknown tunnel status '{}'", name));
}

std::string spec_hash(const TunnelSpec& spec) {
    // nlohmann::json objects keep keys sorted, so the dump is canonical.
    return sha256_hex(nlohmann::json(spec).dump());
}

std::string new_tunnel_id() {
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    return fmt::format("tun-{:08x}", dist(rng));
}

// ── JSON ────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const Locator& l) {
    j = nlohmann::json{{"config_file", l.config_file}, {"profile", l.profile}};
}

void from_json(const nlohmann::json& j, Locator& l) {
    j.at("config_file").get_to(l.config_file);
    j.at("profile").get_to(l.profile);
}

void to_json(nlohmann::json& j, const Forwarding& f) {
    j = nlohmann::json{{"host", f.host}, {"port", f.port}};
}

void from_json(const nlohmann::json& j, Forwarding& f) {
    j.at("host").get_to(f.host);
    j.at("port").get_to(f.port);
}

void to_json(nlohmann::json& j, const TunnelSpec& s) {
    j = nlohmann::json{
        {"locator", s.locator},
        {"forwardings", s.forwardings},
        {"user", s.user},
        {"host", s.host},
        {"identity_file", s.identity_file ? nlohmann::json(*s.identity_file) : nlohmann::json()},
    };
}

void from_json(const nlohmann::json& j, TunnelSpec& s) {
    j.at("locator").get_to(s.locator);
    j.at("forwardings").get_to(s.forwardings);
    j.at("user").get_to(s.user);
    j.at("host").get_to(s.host);
    s.identity_file.reset();
    auto it = j.find("identity_file");
    if (it != j.end() && !it->is_null()) s.identity_file = it->get<std::string>();
}

void to_json(nlohmann::json& j, const TunnelStatus& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"status", to_string(s.status)},
        {"ssh_pid", s.ssh_pid ? nlohmann::json(*s.ssh_pid) : nlohmann::json()},
        {"local_ports", s.local_ports},
        {"spec_hash", s.spec_hash},
    };
}

void from_json(const nlohmann::json& j, TunnelStatus& s) {
    j.at("id").get_to(s.id);
    s.status = parse_tunnel_state(j.at("status").get<std::string>());
    s.ssh_pid.reset();
    auto pid = j.find("ssh_pid");
    if (pid != j.end() && !pid->is_null()) s.ssh_pid = pid->get<int>();
    j.at("local_ports").get_to(s.local_ports);
    j.at("spec_hash").get_to(s.spec_hash);
}
