#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;                            // seconds, connect and each blocking call
    std::optional<std::string> identity_file;    // private key; public key is derived
};

// Output of a remote command run over an exec channel.
struct ExecResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
};

// A single authenticated SSH session (libssh2, blocking mode).
// Authentication tries the identity file if one is given, otherwise the
// ssh-agent and then the default ~/.ssh keys.
class SshSession {
public:
    explicit SshSession(SessionTarget target);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    Result<void> establish(StatusCallback callback = nullptr);
    Result<ExecResult> exec(const std::string& command);
    void close();

    bool is_active() const { return session_ != nullptr; }
    std::string target_str() const { return target_.user + "@" + target_.host; }

private:
    Result<void> authenticate(StatusCallback callback);
    bool try_agent();
    bool try_key_file(const std::string& private_key);
    std::string last_error() const;

    SessionTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
};

// Read a remote file with `cat` over a fresh session.
Result<std::string> fetch_remote_file(const SessionTarget& target,
                                      const std::string& remote_path,
                                      StatusCallback callback = nullptr);
