#include "kubeconfig_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <optional>
#include <fmt/format.h>

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Find the single entry of a named list ("contexts", "clusters", "users").
std::optional<YAML::Node> find_named(const YAML::Node& list, const std::string& name) {
    if (!list || !list.IsSequence()) return std::nullopt;
    for (const auto& entry : list) {
        if (entry["name"] && entry["name"].as<std::string>() == name) return entry;
    }
    return std::nullopt;
}

} // namespace

Result<ServerAddress> parse_server_url(const std::string& url) {
    ServerAddress addr;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return Result<ServerAddress>::Err(fmt::format("Invalid server URL '{}'", url));
    }
    addr.scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) addr.path = rest.substr(path_start);

    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        // [v6-address]:port
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return Result<ServerAddress>::Err(fmt::format("Invalid server URL '{}'", url));
        }
        addr.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_str = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            addr.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            addr.host = authority;
        }
    }

    if (addr.host.empty()) {
        return Result<ServerAddress>::Err(fmt::format("Server URL '{}' has no host", url));
    }

    if (port_str.empty()) {
        addr.port = addr.scheme == "http" ? 80 : DEFAULT_API_PORT;
    } else {
        addr.port = safe_stoi(port_str, -1);
        if (addr.port <= 0 || addr.port > 65535) {
            return Result<ServerAddress>::Err(fmt::format("Server URL '{}' has an invalid port", url));
        }
    }
    return Result<ServerAddress>::Ok(addr);
}

Result<YAML::Node> trim_to_context(const YAML::Node& kubeconfig,
                                   const std::optional<std::string>& context) {
    YAML::Node doc = YAML::Clone(kubeconfig);

    std::string name;
    if (context) {
        name = *context;
        doc["current-context"] = name;
    } else if (doc["current-context"] && doc["current-context"].IsScalar()) {
        name = doc["current-context"].as<std::string>();
    } else {
        return Result<YAML::Node>::Err("Kubeconfig has no current-context and none was configured");
    }

    auto ctx = find_named(doc["contexts"], name);
    if (!ctx) {
        return Result<YAML::Node>::Err(fmt::format("Context '{}' not found in Kubeconfig file.", name));
    }
    const YAML::Node& ctx_body = (*ctx)["context"];
    std::string cluster_name = ctx_body["cluster"].as<std::string>("");
    std::string user_name = ctx_body["user"].as<std::string>("");

    auto cluster = find_named(doc["clusters"], cluster_name);
    if (!cluster) {
        return Result<YAML::Node>::Err(fmt::format("Cluster '{}' not found in Kubeconfig file.", cluster_name));
    }
    auto user = find_named(doc["users"], user_name);
    if (!user) {
        return Result<YAML::Node>::Err(fmt::format("User '{}' not found in Kubeconfig file.", user_name));
    }

    YAML::Node contexts(YAML::NodeType::Sequence);
    contexts.push_back(YAML::Clone(*ctx));
    YAML::Node clusters(YAML::NodeType::Sequence);
    clusters.push_back(YAML::Clone(*cluster));
    YAML::Node users(YAML::NodeType::Sequence);
    users.push_back(YAML::Clone(*user));

    doc["contexts"] = contexts;
    doc["clusters"] = clusters;
    doc["users"] = users;
    return Result<YAML::Node>::Ok(doc);
}

// ── KubeconfigManager ───────────────────────────────────────

KubeconfigManager::KubeconfigManager(fs::path cwd, fs::path state_dir, RemoteFetcher fetcher)
    : cwd_(std::move(cwd)), state_dir_(std::move(state_dir)), fetcher_(std::move(fetcher)) {}

Result<fs::path> KubeconfigManager::resolve_local(const LocalKubeconfig& source) const {
    fs::path path;
    if (source.path) {
        path = expand_user(*source.path);
        if (path.is_relative()) path = cwd_ / path;
    } else if (auto env = platform::get_env("KUBECONFIG")) {
        path = expand_user(*env);
    } else {
        path = platform::home_dir() / ".kube" / "config";
    }

    if (!fs::exists(path)) {
        return Result<fs::path>::Err(fmt::format("Kubeconfig file '{}' does not exist.", path.string()));
    }
    ktun_log(fmt::format("Kubeconfig: using local file {}", path.string()));
    return Result<fs::path>::Ok(path);
}

Result<fs::path> KubeconfigManager::fetch_over_ssh(const std::string& profile,
                                                   const KubeconfigFromSsh& source,
                                                   bool force_refresh,
                                                   StatusCallback callback) {
    fs::path cached = profile_dir(profile) / KUBECONFIG_ORIG;
    if (fs::exists(cached) && !force_refresh) {
        ktun_log(fmt::format("Kubeconfig: reusing cached {}", cached.string()));
        return Result<fs::path>::Ok(cached);
    }

    ktun_log(fmt::format("Kubeconfig: fetching via SSH ({}@{}:{})", source.user, source.host, source.path));
    if (callback) callback(fmt::format("Fetching Kubeconfig via SSH ({}@{}:{})",
                                       source.user, source.host, source.path));

    SessionTarget target;
    target.host = source.host;
    target.user = source.user;
    target.port = SSH_PORT;
    target.timeout = SSH_CONNECT_TIMEOUT_SECS;
    if (source.identity_file) {
        fs::path identity = expand_user(*source.identity_file);
        if (identity.is_relative()) identity = cwd_ / identity;
        target.identity_file = identity.string();
    }

    auto content = fetcher_(target, source.path, callback);
    if (content.is_err()) {
        return Result<fs::path>::Err("Failed to fetch Kubeconfig: " + content.error);
    }

    fs::create_directories(cached.parent_path());
    {
        std::ofstream out(cached, std::ios::trunc);
        if (!out) {
            return Result<fs::path>::Err("Cannot write " + cached.string());
        }
        out << content.value;
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(cached, ec);
            return Result<fs::path>::Err("Short write to " + cached.string());
        }
    }
    return Result<fs::path>::Ok(cached);
}

Result<RawKubeconfig> KubeconfigManager::get_raw_kubeconfig(const std::string& profile,
                                                            const KubeconfigSource& source,
                                                            bool force_refresh,
                                                            StatusCallback callback) {
    auto path = std::visit(overloaded{
        [&](const LocalKubeconfig& local) { return resolve_local(local); },
        [&](const KubeconfigFromSsh& ssh) { return fetch_over_ssh(profile, ssh, force_refresh, callback); },
    }, source);
    if (path.is_err()) return Result<RawKubeconfig>::Err(path.error);

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.value.string());
    } catch (const YAML::Exception& e) {
        return Result<RawKubeconfig>::Err(fmt::format("Failed to parse {}: {}", path.value.string(), e.what()));
    }

    auto trimmed = trim_to_context(doc, source_context(source));
    if (trimmed.is_err()) return Result<RawKubeconfig>::Err(trimmed.error);

    const YAML::Node& cluster = trimmed.value["clusters"][0]["cluster"];
    if (!cluster["server"]) {
        return Result<RawKubeconfig>::Err(fmt::format("{}: cluster has no server address", path.value.string()));
    }
    auto server = parse_server_url(cluster["server"].as<std::string>());
    if (server.is_err()) return Result<RawKubeconfig>::Err(server.error);

    RawKubeconfig raw;
    raw.path = path.value;
    raw.context = trimmed.value["current-context"].as<std::string>();
    raw.api_host = server.value.host;
    raw.api_port = server.value.port;
    ktun_log(fmt::format("Kubeconfig: context '{}' API server {}:{}", raw.context, raw.api_host, raw.api_port));
    return Result<RawKubeconfig>::Ok(raw);
}

Result<fs::path> KubeconfigManager::write_local_kubeconfig(const std::string& profile,
                                                           const RawKubeconfig& raw,
                                                           const std::string& api_host,
                                                           int api_port) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(raw.path.string());
    } catch (const YAML::Exception& e) {
        return Result<fs::path>::Err(fmt::format("Failed to parse {}: {}", raw.path.string(), e.what()));
    }

    auto trimmed = trim_to_context(doc, raw.context);
    if (trimmed.is_err()) return Result<fs::path>::Err(trimmed.error);

    // TODO: keep the path component of the original server URL once a
    // profile with an API server behind a sub-path needs it.
    trimmed.value["clusters"][0]["cluster"]["server"] = fmt::format("https://{}:{}", api_host, api_port);

    fs::path target = profile_dir(profile) / KUBECONFIG_LOCAL;
    fs::create_directories(target.parent_path());

    YAML::Emitter emitter;
    emitter << trimmed.value;

    std::ofstream out(target, std::ios::trunc);
    if (!out) {
        return Result<fs::path>::Err("Cannot write " + target.string());
    }
    out << emitter.c_str() << "\n";
    ktun_log(fmt::format("Kubeconfig: wrote {} (server https://{}:{})", target.string(), api_host, api_port));
    return Result<fs::path>::Ok(target);
}
