#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::optional<std::string> source_context(const KubeconfigSource& source) {
    return std::visit([](const auto& s) { return s.context; }, source);
}

std::string default_profile_name() {
    return platform::get_env(ENV_PROFILE).value_or(DEFAULT_PROFILE);
}

static std::optional<std::string> optional_string(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) return std::nullopt;
    return node[key].as<std::string>();
}

static std::string required_string(const YAML::Node& node, const char* key,
                                   const std::string& where) {
    if (!node[key] || !node[key].IsScalar()) {
        throw std::runtime_error(fmt::format("{}: missing required key '{}'", where, key));
    }
    return node[key].as<std::string>();
}

static KubeconfigSource parse_kubeconfig_source(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return LocalKubeconfig{};
    if (!node.IsMap()) {
        throw std::runtime_error(fmt::format("{}: expected a mapping", where));
    }

    std::string type = node["type"].as<std::string>("local");
    if (type == "local") {
        LocalKubeconfig local;
        local.path = optional_string(node, "path");
        local.context = optional_string(node, "context");
        return local;
    }
    if (type == "ssh") {
        KubeconfigFromSsh ssh;
        ssh.user = required_string(node, "user", where);
        ssh.host = required_string(node, "host", where);
        ssh.path = required_string(node, "path", where);
        ssh.identity_file = optional_string(node, "identity_file");
        ssh.context = optional_string(node, "context");
        return ssh;
    }
    throw std::runtime_error(fmt::format("{}: unsupported kubeconfig type '{}'", where, type));
}

static std::optional<SshTunnelConfig> parse_tunnel(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsMap()) {
        throw std::runtime_error(fmt::format("{}: expected a mapping", where));
    }

    std::string type = node["type"].as<std::string>("ssh");
    if (type != "ssh") {
        throw std::runtime_error(fmt::format("{}: unsupported tunnel type '{}'", where, type));
    }

    SshTunnelConfig tunnel;
    tunnel.user = required_string(node, "user", where);
    tunnel.host = required_string(node, "host", where);
    tunnel.identity_file = optional_string(node, "identity_file");
    return tunnel;
}

Result<fs::path> ProfileConfig::find_config_file(const fs::path& cwd) {
    fs::path dir = fs::absolute(cwd);
    while (true) {
        fs::path candidate = dir / PROFILES_FILENAME;
        if (fs::exists(candidate)) return Result<fs::path>::Ok(candidate);
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }

    fs::path home_candidate = platform::home_dir() / PROFILES_FILENAME;
    if (fs::exists(home_candidate)) return Result<fs::path>::Ok(fs::absolute(home_candidate));

    fs::path fallback = platform::home_dir() / ".config" / "ktun" / PROFILES_FILENAME;
    if (fs::exists(fallback)) return Result<fs::path>::Ok(fs::absolute(fallback));

    return Result<fs::path>::Err(fmt::format(
        "Configuration file '{}' not found in '{}', any of its parent directories or '{}'",
        PROFILES_FILENAME, cwd.string(), fallback.parent_path().string()));
}

Result<ProfileConfig> ProfileConfig::load(const fs::path& file) {
    if (!fs::exists(file)) {
        return Result<ProfileConfig>::Err("Profile config not found at " + file.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(file.string());

        ProfileConfig config;
        config.file_ = fs::absolute(file);

        if (root && !root.IsNull()) {
            if (!root.IsMap()) {
                return Result<ProfileConfig>::Err(file.string() + ": expected a mapping of profiles");
            }
            for (const auto& kv : root) {
                std::string name = kv.first.as<std::string>();
                std::string where = fmt::format("{}: profile '{}'", file.string(), name);
                const YAML::Node& node = kv.second;

                Profile profile;
                if (node && node.IsMap()) {
                    profile.kubeconfig = parse_kubeconfig_source(node["kubeconfig"], where + ".kubeconfig");
                    profile.tunnel = parse_tunnel(node["tunnel"], where + ".tunnel");
                } else if (node && !node.IsNull()) {
                    return Result<ProfileConfig>::Err(where + ": expected a mapping");
                }
                config.profiles_[name] = profile;
            }
        }

        return Result<ProfileConfig>::Ok(config);
    } catch (const std::exception& e) {
        return Result<ProfileConfig>::Err(std::string("Failed to parse profile config: ") + e.what());
    }
}

const Profile* ProfileConfig::find(const std::string& name) const {
    auto it = profiles_.find(name);
    return it == profiles_.end() ? nullptr : &it->second;
}

const Profile& ProfileConfig::require(const std::string& name) const {
    const Profile* profile = find(name);
    if (!profile) {
        throw ProfileError(fmt::format("Profile '{}' not found in '{}'", name, file_.string()));
    }
    return *profile;
}

fs::path ProfileConfig::state_dir() const {
    return file_.parent_path() / PROFILE_STATE_DIRNAME;
}
