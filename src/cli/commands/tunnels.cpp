#include "../ktun_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/tunnel_manager.hpp>
#include <iostream>
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace {

struct TunnelRow {
    std::string profile;
    std::string id;
    TunnelState status;
    std::string proxy;
    std::string forwardings;
};

std::string describe_forwardings(const TunnelSpec& spec, const TunnelStatus& status) {
    std::string out;
    for (const auto& [alias, fwd] : spec.forwardings) {
        auto port = status.local_ports.find(alias);
        std::string local = port != status.local_ports.end() ? std::to_string(port->second) : "?";
        if (!out.empty()) out += ", ";
        out += fmt::format("localhost:{} \xe2\x86\x92 {}:{}", local, fwd.host, fwd.port);
    }
    return out.empty() ? "-" : out;
}

std::string colored_status(TunnelState state) {
    switch (state) {
        case TunnelState::Open:   return theme::green(to_string(state));
        case TunnelState::Broken: return theme::red(to_string(state));
        case TunnelState::Closed: return theme::dim(to_string(state));
    }
    return to_string(state);
}

// Profile argument, else $KTUN_PROFILE, else "default".
std::string profile_arg(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        if (!a.empty() && a[0] != '-') return a;
    }
    return default_profile_name();
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

} // namespace

static int do_list(KtunCLI& cli, const std::vector<std::string>& args) {
    bool all = has_flag(args, "--all");
    const ProfileConfig* config = cli.try_config();
    std::string current_file = config ? config->file().string() : "";

    auto& tunnels = cli.tunnels();
    std::vector<TunnelRecord> records;
    {
        auto session = tunnels.begin_session();
        records = tunnels.get_tunnels(session);
        session.close();
    }

    // Profiles of the current file that could have a tunnel but never had one opened.
    if (config) {
        for (const auto& [name, profile] : config->profiles()) {
            if (!profile.tunnel) continue;
            bool known = std::any_of(records.begin(), records.end(), [&](const TunnelRecord& r) {
                return r.first.locator.config_file == current_file && r.first.locator.profile == name;
            });
            if (known) continue;

            TunnelSpec spec;
            spec.locator = Locator{current_file, name};
            spec.user = profile.tunnel->user;
            spec.host = profile.tunnel->host;
            records.emplace_back(spec, TunnelStatus::empty());
        }
    }

    std::sort(records.begin(), records.end(), [](const TunnelRecord& a, const TunnelRecord& b) {
        const auto& la = a.first.locator;
        const auto& lb = b.first.locator;
        if (la.profile != lb.profile) return la.profile < lb.profile;
        return la.config_file < lb.config_file;
    });

    std::vector<TunnelRow> rows;
    for (const auto& [spec, status] : records) {
        // Without --all only the current profile file is shown; with no file, everything.
        if (!all && config && spec.locator.config_file != current_file) continue;

        TunnelRow row;
        row.profile = spec.locator.profile;
        if (all) row.profile += " (" + spec.locator.config_file + ")";
        row.id = status.id;
        row.status = status.status;
        row.proxy = spec.proxy();
        row.forwardings = describe_forwardings(spec, status);
        rows.push_back(std::move(row));
    }

    if (rows.empty()) {
        std::cout << theme::dim("  No tunnels.") << "\n";
        return 0;
    }

    size_t w0 = 7, w1 = 9, w2 = 6, w3 = 5; // header lengths
    for (const auto& r : rows) {
        w0 = std::max(w0, r.profile.size());
        w1 = std::max(w1, r.id.size());
        w2 = std::max(w2, std::strlen(to_string(r.status)));
        w3 = std::max(w3, r.proxy.size());
    }

    std::string hfmt = fmt::format("  {{:>{}}} {{:<{}}} {{:<{}}} {{:<{}}} {{}}\n",
                                   w0 + 2, w1 + 2, w2 + 2, w3 + 2);

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "PROFILE", "TUNNEL ID", "STATUS", "PROXY", "FORWARDINGS")
              << theme::color::RESET;

    for (const auto& r : rows) {
        std::string sfmt = fmt::format("  {{:>{}}} {{:<{}}} ", w0 + 2, w1 + 2);
        std::cout << theme::color::BLUE << fmt::format(fmt::runtime(sfmt), r.profile, r.id)
                  << theme::color::RESET
                  << colored_status(r.status)
                  // Pad manually for status since it has ANSI codes
                  << std::string(w2 + 3 - std::strlen(to_string(r.status)), ' ')
                  << fmt::format("{:<{}} ", r.proxy, w3 + 2)
                  << r.forwardings << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int do_open(KtunCLI& cli, const std::vector<std::string>& args) {
    std::string name = profile_arg(args);
    auto& profiles = cli.profiles();

    auto cb = [](const std::string& msg) {
        std::cout << theme::log(msg);
    };

    auto session = cli.tunnels().begin_session();
    TunnelStatus status = profiles.open_profile_tunnel(session, name, cb);
    auto record = cli.tunnels().get_tunnel(session, profiles.locator_for(name));
    session.close();

    std::cout << theme::ok(fmt::format("Tunnel {} for '{}' is {}", status.id, name, to_string(status.status)));
    if (record) {
        std::cout << theme::kv("proxy", record->first.proxy());
        std::cout << theme::kv("forwards", describe_forwardings(record->first, status));
    }
    return 0;
}

static int do_close(KtunCLI& cli, const std::vector<std::string>& args) {
    auto& tunnels = cli.tunnels();

    if (has_flag(args, "--all")) {
        auto session = tunnels.begin_session();
        auto records = tunnels.get_tunnels(session);
        for (const auto& [spec, status] : records) {
            auto closed = tunnels.close_tunnel(session, spec.locator);
            std::cout << theme::ok(fmt::format("Closed {} ({})", spec.locator.str(),
                                               closed.id.empty() ? "-" : closed.id));
        }
        session.close();
        if (records.empty()) {
            std::cout << theme::dim("  No tunnels.") << "\n";
        }
        return 0;
    }

    std::string name = profile_arg(args);
    const ProfileConfig& config = cli.require_config();
    Locator locator{config.file().string(), name};

    auto session = tunnels.begin_session();
    auto closed = tunnels.close_tunnel(session, locator);
    session.close();

    if (closed.id.empty()) {
        std::cout << theme::info(fmt::format("No tunnel recorded for '{}'", name));
    } else {
        std::cout << theme::ok(fmt::format("Closed tunnel {} for '{}'", closed.id, name));
    }
    return 0;
}

void register_tunnel_commands(KtunCLI& cli) {
    cli.add_command("list", do_list, "[--all]", "Show tunnels and their status");
    cli.add_command("open", do_open, "[profile]", "Open the tunnel for a profile");
    cli.add_command("close", do_close, "[profile | --all]", "Close one or all tunnels");
}
