#pragma once

#include <string>
#include <map>
#include <optional>
#include <variant>
#include <stdexcept>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Unknown profile, or a profile missing what the command needs.
class ProfileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Kubeconfig read from the local filesystem: `path`, else $KUBECONFIG,
// else ~/.kube/config.
struct LocalKubeconfig {
    std::optional<std::string> path;
    std::optional<std::string> context;
};

// Kubeconfig fetched from `path` on user@host over SSH and cached locally.
struct KubeconfigFromSsh {
    std::string user;
    std::string host;
    std::string path;
    std::optional<std::string> identity_file;
    std::optional<std::string> context;
};

using KubeconfigSource = std::variant<LocalKubeconfig, KubeconfigFromSsh>;

// The requested kubeconfig context, if the source names one.
std::optional<std::string> source_context(const KubeconfigSource& source);

struct SshTunnelConfig {
    std::string user;
    std::string host;
    std::optional<std::string> identity_file;
};

struct Profile {
    KubeconfigSource kubeconfig = LocalKubeconfig{};
    std::optional<SshTunnelConfig> tunnel;
};

// Contents of a ktun-profiles.yaml file.
class ProfileConfig {
public:
    // Search cwd, each parent, $HOME, then ~/.config/ktun for ktun-profiles.yaml.
    static Result<fs::path> find_config_file(const fs::path& cwd = fs::current_path());

    // Parse the given file.
    static Result<ProfileConfig> load(const fs::path& file);

    const fs::path& file() const { return file_; }
    const std::map<std::string, Profile>& profiles() const { return profiles_; }

    // nullptr if not defined
    const Profile* find(const std::string& name) const;

    // Throws ProfileError if not defined.
    const Profile& require(const std::string& name) const;

    // <dir of file>/.ktun; per-profile kubeconfig state lives below it.
    fs::path state_dir() const;

    ProfileConfig() = default;

private:
    fs::path file_;
    std::map<std::string, Profile> profiles_;
};

// Profile named by $KTUN_PROFILE, else "default".
std::string default_profile_name();
