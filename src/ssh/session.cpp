#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <filesystem>
#include <mutex>
#include <fmt/format.h>

namespace fs = std::filesystem;

static void ensure_libssh2_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { libssh2_init(0); });
}

SshSession::SshSession(SessionTarget target)
    : target_(std::move(target)) {}

SshSession::~SshSession() {
    close();
}

std::string SshSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg ? std::string(msg, len) : "unknown error";
}

Result<void> SshSession::establish(StatusCallback callback) {
    ensure_libssh2_init();

    if (callback) callback("Connecting to " + target_.host + "...");

    auto sock = platform::tcp_connect(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) return Result<void>::Err(sock.error);
    sock_ = sock.value;

    session_ = libssh2_session_init();
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        std::string err = "SSH handshake failed: " + last_error();
        close();
        return Result<void>::Err(err);
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = authenticate(callback);
    if (auth.is_err()) {
        close();
        return auth;
    }

    ktun_log(fmt::format("SshSession: connected to {}", target_str()));
    return Result<void>::Ok();
}

bool SshSession::try_agent() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            if (libssh2_agent_userauth(agent, target_.user.c_str(), identity) == 0) {
                ok = true;
                break;
            }
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

bool SshSession::try_key_file(const std::string& private_key) {
    if (!fs::exists(private_key)) return false;
    int rc = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                                                 nullptr, private_key.c_str(), nullptr);
    return rc == 0;
}

Result<void> SshSession::authenticate(StatusCallback callback) {
    // An explicit identity wins over whatever the agent offers.
    if (target_.identity_file) {
        if (callback) callback("Using identity file " + *target_.identity_file);
        if (try_key_file(*target_.identity_file)) return Result<void>::Ok();
        return Result<void>::Err(fmt::format("Public key authentication as {} with '{}' failed: {}",
                                             target_.user, *target_.identity_file, last_error()));
    }

    if (try_agent()) return Result<void>::Ok();

    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        fs::path key = platform::home_dir() / ".ssh" / name;
        if (try_key_file(key.string())) {
            if (callback) callback("Authenticated with " + key.string());
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(fmt::format("Authentication as {} failed (no usable agent identity or key)",
                                         target_.user));
}

Result<ExecResult> SshSession::exec(const std::string& command) {
    if (!session_) return Result<ExecResult>::Err("Not connected");

    LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(session_);
    if (!channel) {
        return Result<ExecResult>::Err("Failed to open SSH channel: " + last_error());
    }

    if (libssh2_channel_exec(channel, command.c_str()) != 0) {
        std::string err = "Failed to execute remote command: " + last_error();
        libssh2_channel_free(channel);
        return Result<ExecResult>::Err(err);
    }

    ExecResult result;
    char buf[SSH_READ_BUF_SIZE];
    ssize_t n;
    while ((n = libssh2_channel_read(channel, buf, sizeof(buf))) > 0) {
        result.stdout_data.append(buf, static_cast<size_t>(n));
    }
    if (n < 0) {
        std::string err = "SSH channel read error: " + last_error();
        libssh2_channel_free(channel);
        return Result<ExecResult>::Err(err);
    }
    while ((n = libssh2_channel_read_stderr(channel, buf, sizeof(buf))) > 0) {
        result.stderr_data.append(buf, static_cast<size_t>(n));
    }

    libssh2_channel_close(channel);
    libssh2_channel_wait_closed(channel);
    result.exit_code = libssh2_channel_get_exit_status(channel);
    libssh2_channel_free(channel);

    return Result<ExecResult>::Ok(result);
}

void SshSession::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

Result<std::string> fetch_remote_file(const SessionTarget& target,
                                      const std::string& remote_path,
                                      StatusCallback callback) {
    SshSession session(target);
    auto established = session.establish(callback);
    if (established.is_err()) return Result<std::string>::Err(established.error);

    std::string command = "cat " + shell_quote(remote_path);
    auto result = session.exec(command);
    if (result.is_err()) return Result<std::string>::Err(result.error);

    if (!result.value.success()) {
        std::string err = result.value.stderr_data;
        trim(err);
        return Result<std::string>::Err(fmt::format("'{}' on {} exited with {}: {}",
                                                    command, session.target_str(),
                                                    result.value.exit_code, err));
    }
    return Result<std::string>::Ok(result.value.stdout_data);
}
