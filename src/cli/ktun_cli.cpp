#include "ktun_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

KtunCLI::KtunCLI() {
    register_tunnel_commands(*this);
    register_profile_commands(*this);
}

void KtunCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    commands_[name] = Command{std::move(handler), usage, help};
}

bool KtunCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

int KtunCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        return 1;
    }
    ktun_log(fmt::format("ktun {} ({} args)", command, args.size()));
    return it->second.handler(*this, args);
}

void KtunCLI::print_commands() const {
    for (const auto& [name, cmd] : commands_) {
        std::string left = fmt::format("ktun {} {}", name, cmd.usage);
        std::cout << theme::color::BLUE << fmt::format("    {:<34}", left)
                  << theme::color::RESET << theme::color::DIM
                  << cmd.help << theme::color::RESET << "\n";
    }
}

const ProfileConfig* KtunCLI::try_config() {
    if (!config_loaded_) {
        config_loaded_ = true;
        auto file = ProfileConfig::find_config_file();
        if (file.is_ok()) {
            auto loaded = ProfileConfig::load(file.value);
            if (loaded.is_err()) {
                throw ProfileError(loaded.error);
            }
            config_ = std::move(loaded.value);
            ktun_log("Using profile config " + config_->file().string());
        } else {
            ktun_log("No profile config: " + file.error);
        }
    }
    return config_ ? &*config_ : nullptr;
}

const ProfileConfig& KtunCLI::require_config() {
    const ProfileConfig* config = try_config();
    if (!config) {
        throw ProfileError(fmt::format("No {} found in this directory, its parents, "
                                       "your home directory or ~/.config/ktun.",
                                       PROFILES_FILENAME));
    }
    return *config;
}

TunnelManager& KtunCLI::tunnels() {
    if (!tunnels_) {
        launcher_ = std::make_unique<SystemProcessLauncher>(ktun_log_path());
        tunnels_ = std::make_unique<TunnelManager>(TunnelManager::default_state_dir(), *launcher_);
    }
    return *tunnels_;
}

ProfileManager& KtunCLI::profiles() {
    if (!profiles_) {
        const ProfileConfig& config = require_config();
        kubeconfig_ = std::make_unique<KubeconfigManager>(
            config.file().parent_path(), config.state_dir() / "profiles");
        probe_ = std::make_unique<HttpsProbe>();
        profiles_ = std::make_unique<ProfileManager>(config, tunnels(), *kubeconfig_, *probe_);
    }
    return *profiles_;
}
