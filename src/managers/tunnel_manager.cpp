#include "tunnel_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <set>
#include <fmt/format.h>

using Records = SerializingStore<TunnelRecord>;

TunnelManager::TunnelManager(fs::path state_dir, ProcessLauncher& launcher)
    : state_dir_(std::move(state_dir)),
      store_(state_dir_ / STATE_FILENAME, state_dir_ / LOCK_FILENAME, LOCK_TIMEOUT_MS),
      launcher_(launcher),
      rng_(std::random_device{}()) {}

fs::path TunnelManager::default_state_dir() {
    if (auto env = platform::get_env(ENV_STATE_DIR)) {
        return expand_user(*env);
    }
    return platform::home_dir() / ".ktun" / "tunnels";
}

JsonFileSession TunnelManager::begin_session() const {
    return store_.begin_session();
}

// ── Status helpers ──────────────────────────────────────────

void TunnelManager::refresh_status(const Locator& locator, TunnelStatus& status) {
    if (!status.is_open()) return;

    if (status.ssh_pid && launcher_.is_alive(*status.ssh_pid)) return;

    ktun_log(fmt::format("TunnelManager: '{}' ({}) process {} is gone, marking broken",
                         locator.str(), status.id,
                         status.ssh_pid ? std::to_string(*status.ssh_pid) : "-"));
    status.status = TunnelState::Broken;
    status.ssh_pid.reset();
    // local_ports stay recorded for display until the next open/close.
}

void TunnelManager::stop_process(const Locator& locator, TunnelStatus& status) {
    if (status.ssh_pid) {
        ktun_log(fmt::format("TunnelManager: terminating ssh pid {} for '{}' ({})",
                             *status.ssh_pid, locator.str(), status.id));
        launcher_.terminate(*status.ssh_pid);
    }
    status.ssh_pid.reset();
    status.local_ports.clear();
}

std::map<std::string, int> TunnelManager::allocate_ports(const TunnelSpec& spec) {
    // Optimistic: no bind probe. Distinct within one tunnel only.
    std::uniform_int_distribution<int> dist(LOCAL_PORT_MIN, LOCAL_PORT_MAX);
    std::map<std::string, int> ports;
    std::set<int> used;
    for (const auto& [alias, fwd] : spec.forwardings) {
        int port;
        do {
            port = dist(rng_);
        } while (!used.insert(port).second);
        ports[alias] = port;
    }
    return ports;
}

std::vector<std::string> TunnelManager::ssh_command(const TunnelSpec& spec,
                                                    const std::map<std::string, int>& local_ports) {
    std::string forwards;
    for (const auto& [alias, fwd] : spec.forwardings) {
        if (!forwards.empty()) forwards += ",";
        forwards += fmt::format("{}:{}:{}", local_ports.at(alias), fwd.host, fwd.port);
    }

    std::vector<std::string> argv = {"ssh", "-N", "-L", forwards};
    if (spec.identity_file) {
        argv.push_back("-i");
        argv.push_back(*spec.identity_file);
    }
    argv.push_back(spec.proxy());
    return argv;
}

// ── Queries ─────────────────────────────────────────────────

std::vector<TunnelRecord> TunnelManager::get_tunnels(KvStore& session) {
    Records records(session);
    std::vector<TunnelRecord> result;
    for (const auto& key : records.list()) {
        auto record = records.get(key);
        refresh_status(record.first.locator, record.second);
        records.set(key, record);
        result.push_back(std::move(record));
    }
    return result;
}

std::optional<TunnelRecord> TunnelManager::get_tunnel(KvStore& session, const Locator& locator) {
    Records records(session);
    TunnelRecord record;
    try {
        record = records.get(locator.str());
    } catch (const KeyNotFound&) {
        return std::nullopt;
    }
    refresh_status(locator, record.second);
    records.set(locator.str(), record);
    return record;
}

// ── Lifecycle ───────────────────────────────────────────────

TunnelStatus TunnelManager::open_tunnel(KvStore& session, const TunnelSpec& spec) {
    Records records(session);
    const std::string key = spec.locator.str();
    const std::string hash = spec_hash(spec);

    std::optional<TunnelStatus> existing;
    try {
        existing = records.get(key).second;
    } catch (const KeyNotFound&) {
        existing.reset();
    }

    if (existing) {
        refresh_status(spec.locator, *existing);
        if (existing->is_open() && existing->spec_hash == hash) {
            ktun_log(fmt::format("TunnelManager: '{}' already open ({}, pid {})",
                                 key, existing->id, *existing->ssh_pid));
            return *existing;
        }

        if (existing->is_open()) {
            ktun_log(fmt::format("TunnelManager: spec for '{}' changed, replacing {}", key, existing->id));
        } else {
            ktun_log(fmt::format("TunnelManager: '{}' is {}, replacing {}",
                                 key, to_string(existing->status), existing->id));
        }
        stop_process(spec.locator, *existing);
    }

    TunnelStatus status;
    status.id = new_tunnel_id();
    status.status = TunnelState::Closed;
    status.spec_hash = hash;

    // Checkpoint: an interrupted open still leaves an inspectable record.
    records.set(key, {spec, status});

    auto ports = allocate_ports(spec);
    auto argv = ssh_command(spec, ports);
    ktun_log(fmt::format("TunnelManager: opening {} for '{}': $ {}", status.id, key, join_command(argv)));

    int pid = launcher_.spawn(argv);

    status.status = TunnelState::Open;
    status.ssh_pid = pid;
    status.local_ports = std::move(ports);
    records.set(key, {spec, status});

    ktun_log(fmt::format("TunnelManager: {} started with pid {}", status.id, pid));
    return status;
}

TunnelStatus TunnelManager::close_tunnel(KvStore& session, const Locator& locator) {
    Records records(session);
    const std::string key = locator.str();

    TunnelRecord record;
    try {
        record = records.get(key);
    } catch (const KeyNotFound&) {
        ktun_log(fmt::format("TunnelManager: no tunnel found for '{}'", key));
        return TunnelStatus::empty();
    }

    auto& status = record.second;
    refresh_status(locator, status);
    if (status.is_open()) {
        ktun_log(fmt::format("TunnelManager: closing {} for '{}'", status.id, key));
    } else {
        ktun_log(fmt::format("TunnelManager: '{}' is already {}", key, to_string(status.status)));
    }

    // Always transition, so the record ends closed whatever it was before.
    stop_process(locator, status);
    status.status = TunnelState::Closed;
    records.set(key, record);
    return status;
}
