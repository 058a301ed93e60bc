#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <random>
#include <filesystem>
#include <platform/process.hpp>
#include <store/json_file_store.hpp>
#include <store/serializing_store.hpp>
#include "tunnel_types.hpp"

namespace fs = std::filesystem;

// Owns the lifecycle of ssh port-forwarding processes across invocations.
//
// Records live in a JsonFileKvStore under <state_dir>/state.json, keyed by
// Locator::str(). A record outlives the process that created it: the ssh
// child is detached and only reaped by close_tunnel, a replacing open, or an
// outside signal.
//
// Every operation takes the session returned by begin_session(); reads and
// the writes that depend on them must share one session.
class TunnelManager {
public:
    TunnelManager(fs::path state_dir, ProcessLauncher& launcher);

    // $KTUN_STATE_DIR, else ~/.ktun/tunnels
    static fs::path default_state_dir();

    // Lock the state file (bounded wait, then LockTimeout).
    JsonFileSession begin_session() const;

    // All records, each refreshed and written back.
    std::vector<TunnelRecord> get_tunnels(KvStore& session);

    // One record, refreshed and written back.
    std::optional<TunnelRecord> get_tunnel(KvStore& session, const Locator& locator);

    // Ensure a tunnel matching spec is running. A live tunnel with the same
    // spec hash is returned untouched; anything else is replaced.
    TunnelStatus open_tunnel(KvStore& session, const TunnelSpec& spec);

    // Stop the tunnel for locator. Always yields a closed status; an unknown
    // locator yields TunnelStatus::empty().
    TunnelStatus close_tunnel(KvStore& session, const Locator& locator);

    // ssh -N -L <lport>:<host>:<port>[,...] [-i <identity>] <user>@<host>
    static std::vector<std::string> ssh_command(const TunnelSpec& spec,
                                                const std::map<std::string, int>& local_ports);

    const fs::path& state_dir() const { return state_dir_; }

private:
    // Liveness probe; open → broken when the recorded process is gone.
    void refresh_status(const Locator& locator, TunnelStatus& status);

    // Terminate the recorded process (if any) and clear process/port fields.
    void stop_process(const Locator& locator, TunnelStatus& status);

    std::map<std::string, int> allocate_ports(const TunnelSpec& spec);

    fs::path state_dir_;
    JsonFileKvStore store_;
    ProcessLauncher& launcher_;
    std::mt19937 rng_;
};
