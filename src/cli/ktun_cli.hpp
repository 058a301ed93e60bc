#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <platform/process.hpp>
#include <managers/tunnel_manager.hpp>
#include <managers/kubeconfig_manager.hpp>
#include <managers/profile_manager.hpp>
#include <managers/api_probe.hpp>

class KtunCLI;

// Forward declarations for command registration
void register_tunnel_commands(KtunCLI& cli);
void register_profile_commands(KtunCLI& cli);

class KtunCLI {
public:
    KtunCLI();

    // Handlers get the arguments after the command name and return the exit code.
    using CommandHandler = std::function<int(KtunCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    bool has_command(const std::string& name) const;
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_commands() const;

    // Load ktun-profiles.yaml if found. A file that exists but does not
    // parse is an error; a missing one is not.
    const ProfileConfig* try_config();

    // Like try_config(), but a missing file throws ProfileError.
    const ProfileConfig& require_config();

    TunnelManager& tunnels();
    ProfileManager& profiles();

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;

    bool config_loaded_ = false;
    std::optional<ProfileConfig> config_;

    std::unique_ptr<SystemProcessLauncher> launcher_;
    std::unique_ptr<TunnelManager> tunnels_;
    std::unique_ptr<KubeconfigManager> kubeconfig_;
    std::unique_ptr<HttpsProbe> probe_;
    std::unique_ptr<ProfileManager> profiles_;
};
