#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/session.hpp>

namespace fs = std::filesystem;

// Address parsed out of a kubeconfig `server:` URL.
struct ServerAddress {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
};

// "https://host[:port][/path]"; port defaults to 443 for https, 80 for http.
Result<ServerAddress> parse_server_url(const std::string& url);

// Reduce a kubeconfig document to a single context plus its cluster and
// user. With no context given, current-context is kept. The returned node
// is a deep copy.
Result<YAML::Node> trim_to_context(const YAML::Node& kubeconfig,
                                   const std::optional<std::string>& context);

// Kubeconfig as obtained from a profile's source, before rewriting.
struct RawKubeconfig {
    fs::path path;
    std::string context;
    std::string api_host;
    int api_port = 0;
};

// Obtains kubeconfig files for profiles and writes the rewritten copy
// handed to kubectl. Per-profile files live in <state_dir>/<profile>/.
class KubeconfigManager {
public:
    using RemoteFetcher = std::function<Result<std::string>(
        const SessionTarget&, const std::string&, StatusCallback)>;

    // cwd: base for relative paths in the profile (the profile file's directory).
    KubeconfigManager(fs::path cwd, fs::path state_dir,
                      RemoteFetcher fetcher = fetch_remote_file);

    // Locate (local) or fetch and cache (ssh) the kubeconfig, then read the
    // API server address of the selected context.
    Result<RawKubeconfig> get_raw_kubeconfig(const std::string& profile,
                                             const KubeconfigSource& source,
                                             bool force_refresh = false,
                                             StatusCallback callback = nullptr);

    // Write <state_dir>/<profile>/kubeconfig.local: trimmed to raw.context,
    // server replaced with https://<api_host>:<api_port>.
    Result<fs::path> write_local_kubeconfig(const std::string& profile,
                                            const RawKubeconfig& raw,
                                            const std::string& api_host,
                                            int api_port);

    fs::path profile_dir(const std::string& profile) const { return state_dir_ / profile; }

private:
    Result<fs::path> resolve_local(const LocalKubeconfig& source) const;
    Result<fs::path> fetch_over_ssh(const std::string& profile,
                                    const KubeconfigFromSsh& source,
                                    bool force_refresh,
                                    StatusCallback callback);

    fs::path cwd_;
    fs::path state_dir_;
    RemoteFetcher fetcher_;
};
