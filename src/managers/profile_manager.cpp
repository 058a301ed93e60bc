#include "profile_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <fmt/format.h>

ProfileManager::ProfileManager(const ProfileConfig& config,
                               TunnelManager& tunnels,
                               KubeconfigManager& kubeconfig,
                               EndpointProbe& probe,
                               Sleeper sleeper)
    : config_(config), tunnels_(tunnels), kubeconfig_(kubeconfig),
      probe_(probe), sleeper_(std::move(sleeper)) {}

Locator ProfileManager::locator_for(const std::string& name) const {
    return Locator{config_.file().string(), name};
}

TunnelSpec ProfileManager::tunnel_spec_for(const fs::path& config_file,
                                           const std::string& profile,
                                           const SshTunnelConfig& tunnel,
                                           const std::string& api_host,
                                           int api_port) {
    TunnelSpec spec;
    spec.locator = Locator{config_file.string(), profile};
    spec.forwardings[KUBERNETES_FORWARDING] = Forwarding{api_host, api_port};
    spec.user = tunnel.user;
    spec.host = tunnel.host;
    if (tunnel.identity_file) {
        fs::path identity = expand_user(*tunnel.identity_file);
        if (identity.is_relative()) identity = config_file.parent_path() / identity;
        spec.identity_file = identity.string();
    }
    return spec;
}

const SshTunnelConfig& ProfileManager::require_tunnel(const std::string& name,
                                                      const Profile& profile) const {
    if (!profile.tunnel) {
        throw ProfileError(fmt::format("Profile '{}' does not have a tunnel configuration.", name));
    }
    return *profile.tunnel;
}

TunnelSpec ProfileManager::build_spec(const std::string& name, const SshTunnelConfig& tunnel,
                                      const RawKubeconfig& raw) const {
    return tunnel_spec_for(config_.file(), name, tunnel, raw.api_host, raw.api_port);
}

TunnelStatus ProfileManager::open_profile_tunnel(KvStore& session, const std::string& name,
                                                 StatusCallback callback) {
    const Profile& profile = config_.require(name);
    const SshTunnelConfig& tunnel = require_tunnel(name, profile);

    auto raw = kubeconfig_.get_raw_kubeconfig(name, profile.kubeconfig, false, callback);
    if (raw.is_err()) throw std::runtime_error(raw.error);

    return tunnels_.open_tunnel(session, build_spec(name, tunnel, raw.value));
}

void ProfileManager::wait_for_api_server(const std::string& host, int port, int grace_secs) {
    int attempts = std::max(1, grace_secs * 1000 / API_PROBE_INTERVAL_MS);
    int remaining_ms = grace_secs * 1000;
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; attempt++) {
        int timeout = std::max(1, std::min(API_PROBE_TIMEOUT_MS, remaining_ms));
        auto result = probe_.probe(host, port, timeout);
        if (result.is_ok()) {
            ktun_log(fmt::format("API server {}:{} reachable (attempt {}/{})", host, port, attempt, attempts));
            return;
        }
        last_error = result.error;
        ktun_log(fmt::format("API server {}:{} not reachable (attempt {}/{}): {}",
                             host, port, attempt, attempts, last_error));
        remaining_ms -= API_PROBE_INTERVAL_MS;
        if (attempt < attempts) sleeper_(API_PROBE_INTERVAL_MS);
    }

    throw ApiServerUnreachable(fmt::format("API server https://{}:{} unreachable after {}s: {}",
                                           host, port, grace_secs, last_error));
}

ActivatedProfile ProfileManager::activate_profile(KvStore& session, const std::string& name,
                                                  StatusCallback callback) {
    const Profile& profile = config_.require(name);

    auto raw = kubeconfig_.get_raw_kubeconfig(name, profile.kubeconfig, false, callback);
    if (raw.is_err()) throw std::runtime_error(raw.error);

    ActivatedProfile activated;
    std::string api_host = raw.value.api_host;
    int api_port = raw.value.api_port;
    int grace = API_GRACE_REUSED_SECS;

    if (profile.tunnel) {
        TunnelSpec spec = build_spec(name, *profile.tunnel, raw.value);

        auto prior = tunnels_.get_tunnel(session, spec.locator);
        TunnelStatus status = tunnels_.open_tunnel(session, spec);

        bool restarted = !prior || !prior->second.is_open() || prior->second.id != status.id;
        grace = restarted ? API_GRACE_FRESH_SECS : API_GRACE_REUSED_SECS;

        api_host = "localhost";
        api_port = status.local_ports.at(KUBERNETES_FORWARDING);
        if (callback) callback(fmt::format("Tunnel {} → {} → {}:{}", status.id, spec.proxy(),
                                           raw.value.api_host, raw.value.api_port));
        activated.tunnel = status;
    }

    ktun_log(fmt::format("Checking API server connectivity (https://{}:{}, grace {}s)", api_host, api_port, grace));
    if (callback) callback(fmt::format("Checking API server connectivity (https://{}:{})", api_host, api_port));
    wait_for_api_server(api_host, api_port, grace);

    auto path = kubeconfig_.write_local_kubeconfig(name, raw.value, api_host, api_port);
    if (path.is_err()) throw std::runtime_error(path.error);
    activated.kubeconfig = path.value;
    return activated;
}
