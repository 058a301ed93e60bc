#pragma once

#include <string>
#include <optional>
#include <functional>
#include <stdexcept>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <store/kv_store.hpp>
#include "tunnel_manager.hpp"
#include "kubeconfig_manager.hpp"
#include "api_probe.hpp"

namespace fs = std::filesystem;

// The API server did not answer within the grace period.
class ApiServerUnreachable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ActivatedProfile {
    fs::path kubeconfig;
    std::optional<TunnelStatus> tunnel;
};

// Combines the tunnel manager and the kubeconfig manager: makes sure the
// tunnel (if any) for a profile is running and a kubeconfig pointing through
// it exists.
class ProfileManager {
public:
    using Sleeper = std::function<void(int)>;

    ProfileManager(const ProfileConfig& config,
                   TunnelManager& tunnels,
                   KubeconfigManager& kubeconfig,
                   EndpointProbe& probe,
                   Sleeper sleeper = platform::sleep_ms);

    // Fetch/locate the kubeconfig, open the tunnel, rewrite the server address
    // to the tunnel's local port and wait for the API server to answer.
    ActivatedProfile activate_profile(KvStore& session, const std::string& name,
                                      StatusCallback callback = nullptr);

    // Open (or reuse) the profile's tunnel only. Throws ProfileError if the
    // profile has no tunnel.
    TunnelStatus open_profile_tunnel(KvStore& session, const std::string& name,
                                     StatusCallback callback = nullptr);

    Locator locator_for(const std::string& name) const;

    // Probe host:port until it answers or grace_secs worth of attempts
    // (one per API_PROBE_INTERVAL_MS) are used up.
    void wait_for_api_server(const std::string& host, int port, int grace_secs);

    static TunnelSpec tunnel_spec_for(const fs::path& config_file,
                                      const std::string& profile,
                                      const SshTunnelConfig& tunnel,
                                      const std::string& api_host,
                                      int api_port);

    const ProfileConfig& config() const { return config_; }

private:
    const SshTunnelConfig& require_tunnel(const std::string& name, const Profile& profile) const;
    TunnelSpec build_spec(const std::string& name, const SshTunnelConfig& tunnel,
                          const RawKubeconfig& raw) const;

    const ProfileConfig& config_;
    TunnelManager& tunnels_;
    KubeconfigManager& kubeconfig_;
    EndpointProbe& probe_;
    Sleeper sleeper_;
};
