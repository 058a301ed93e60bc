#include "../ktun_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <iostream>
#include <fmt/format.h>

static std::string profile_arg(const std::vector<std::string>& args) {
    if (!args.empty() && !args[0].empty() && args[0][0] != '-') return args[0];
    return default_profile_name();
}

// Activation holds the state lock only for its own duration.
static ActivatedProfile activate(KtunCLI& cli, const std::string& name, bool verbose) {
    auto& profiles = cli.profiles();
    auto cb = [verbose](const std::string& msg) {
        if (verbose) std::cerr << theme::log(msg);
    };

    auto session = cli.tunnels().begin_session();
    ActivatedProfile activated = profiles.activate_profile(session, name, cb);
    session.close();
    return activated;
}

static int do_activate(KtunCLI& cli, const std::vector<std::string>& args) {
    std::string name = profile_arg(args);
    auto activated = activate(cli, name, true);

    std::cout << theme::ok(fmt::format("Profile '{}' is active", name));
    if (activated.tunnel) {
        std::cout << theme::kv("tunnel", fmt::format("{} (pid {})", activated.tunnel->id,
                                                     activated.tunnel->ssh_pid ? *activated.tunnel->ssh_pid : -1));
    }
    std::cout << theme::kv("config", activated.kubeconfig.string());
    return 0;
}

// Prints only the export line on stdout so it can be eval'd.
static int do_env(KtunCLI& cli, const std::vector<std::string>& args) {
    std::string name = profile_arg(args);
    auto activated = activate(cli, name, false);
    std::cout << "export KUBECONFIG=" << shell_quote(activated.kubeconfig.string()) << "\n";
    return 0;
}

static int do_run(KtunCLI& cli, const std::vector<std::string>& args) {
    std::string name = default_profile_name();
    std::vector<std::string> command;

    size_t i = 0;
    for (; i < args.size(); i++) {
        if (args[i] == "--") {
            i++;
            break;
        }
        if (args[i] == "--profile" && i + 1 < args.size()) {
            name = args[++i];
        } else {
            // First non-option word starts the command.
            break;
        }
    }
    command.assign(args.begin() + i, args.end());

    if (command.empty()) {
        std::cout << theme::fail("Missing command.");
        std::cout << theme::step("Usage: ktun run [--profile <p>] -- <cmd...>");
        return 1;
    }

    auto activated = activate(cli, name, true);

    std::vector<std::string> rest(command.begin() + 1, command.end());
    int code = platform::run_foreground(command[0], rest,
                                        {{"KUBECONFIG", activated.kubeconfig.string()}});
    if (code == 127) {
        std::cerr << theme::fail("Failed to run " + command[0]);
    }
    return code;
}

void register_profile_commands(KtunCLI& cli) {
    cli.add_command("activate", do_activate, "[profile]", "Activate a profile (tunnel + kubeconfig)");
    cli.add_command("env", do_env, "[profile]", "Print export KUBECONFIG=... for a profile");
    cli.add_command("run", do_run, "[--profile p] -- cmd...", "Run a command against a profile");
}
