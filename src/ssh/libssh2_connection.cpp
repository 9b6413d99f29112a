#include "libssh2_connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

// libssh2_init is not thread-safe; many hosts connect concurrently.
static bool init_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

// Block on the session socket in the direction libssh2 is waiting for.
static void wait_socket(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms) {
    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock, events, timeout_ms);
}

LibSSH2Connection::LibSSH2Connection(const SessionTarget& target)
    : target_(target) {
    target_str_ = target_.user.empty()
        ? fmt::format("{}:{}", target_.host, target_.port)
        : fmt::format("{}@{}:{}", target_.user, target_.host, target_.port);
}

LibSSH2Connection::~LibSSH2Connection() {
    close();
}

bool LibSSH2Connection::is_connected() const {
    // A command in flight holds the lock; the session is in use, so alive.
    std::unique_lock<std::mutex> lock(io_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return active_;

    if (!active_ || !session_ || sock_ == FLEETWATCH_INVALID_SOCKET) return false;

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) return false;

    int seconds_to_next = 0;
    return libssh2_keepalive_send(session_, &seconds_to_next) == 0 ||
           libssh2_session_last_errno(session_) == LIBSSH2_ERROR_EAGAIN;
}

void LibSSH2Connection::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    teardown("Normal disconnection");
}

void LibSSH2Connection::teardown(const char* reason) {
    active_ = false;

    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != FLEETWATCH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = FLEETWATCH_INVALID_SOCKET;
    }
}

SSHResult LibSSH2Connection::run(const std::string& command, int timeout_secs) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (!active_) {
        auto established = establish();
        if (established.transport_failed()) {
            return established;
        }
    }

    auto result = exec(command, timeout_secs);
    if (result.error == ChannelError::Channel) {
        // The session died underneath us; the next run reconnects.
        fleet_log_debug(fmt::format("{}: channel error, dropping session", target_str_));
        teardown("Channel error");
    }
    return result;
}

SSHResult LibSSH2Connection::establish() {
    teardown("Reconnecting");

    if (!init_libssh2()) {
        return SSHResult{-1, "", "Failed to initialize libssh2", ChannelError::Connect};
    }

    auto sock_result = open_socket();
    if (sock_result.transport_failed()) return sock_result;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return SSHResult{-1, "", "Failed to create SSH session", ChannelError::Connect};
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int timeout_ms = target_.timeout * 1000;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) {
            teardown("Handshake timed out");
            return SSHResult{-1, "", "SSH handshake timed out", ChannelError::Timeout};
        }
        wait_socket(session_, sock_, timeout_ms);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed", ChannelError::Connect};
    }

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    auto auth_result = authenticate();
    if (auth_result.transport_failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    fleet_log_debug(fmt::format("{}: session established", target_str_));
    return SSHResult{0, "", ""};
}

SSHResult LibSSH2Connection::open_socket() {
    std::string error;
    bool timed_out = false;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000,
                                  error, timed_out);
    if (sock_ == FLEETWATCH_INVALID_SOCKET) {
        return SSHResult{-1, "", error,
                         timed_out ? ChannelError::Timeout : ChannelError::Connect};
    }
    return SSHResult{0, "", ""};
}

SSHResult LibSSH2Connection::authenticate() {
    const std::string& user = target_.user;
    int timeout_ms = target_.timeout * 1000;
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        wait_socket(session_, sock_, timeout_ms);
    }
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return SSHResult{0, "", ""};
    }

    std::string methods = auth_list ? auth_list : "";
    if (methods.find("publickey") == std::string::npos) {
        return SSHResult{-1, "", "server does not accept public key authentication (offers: " +
                         methods + ")", ChannelError::Auth};
    }

    // Explicit key first, when configured
    std::vector<fs::path> keys;
    if (target_.ssh_key_path) {
        keys.emplace_back(*target_.ssh_key_path);
    }

    // ssh-agent. The agent API is blocking-only, so flip the session.
    libssh2_session_set_blocking(session_, 1);
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent) {
        bool authed = false;
        if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                    authed = true;
                    break;
                }
                prev = identity;
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
        if (authed) {
            libssh2_session_set_blocking(session_, 0);
            return SSHResult{0, "", ""};
        }
    }
    libssh2_session_set_blocking(session_, 0);

    // Default identity files
    fs::path ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        keys.push_back(ssh_dir / name);
    }

    std::string last_error = "no usable identity in ssh-agent or ~/.ssh";
    for (const auto& key : keys) {
        if (!fs::exists(key)) continue;
        std::string pub = key.string() + ".pub";
        const char* pub_path = fs::exists(pub) ? pub.c_str() : nullptr;

        while ((ret = libssh2_userauth_publickey_fromfile(
                    session_, user.c_str(), pub_path, key.c_str(), nullptr)) == LIBSSH2_ERROR_EAGAIN) {
            wait_socket(session_, sock_, timeout_ms);
        }
        if (ret == 0) {
            return SSHResult{0, "", ""};
        }
        if (ret == LIBSSH2_ERROR_FILE) {
            last_error = "private key " + key.string() + " is encrypted or unreadable";
        } else {
            last_error = "key " + key.string() + " was rejected";
        }
    }

    return SSHResult{-1, "", last_error, ChannelError::Auth};
}

SSHResult LibSSH2Connection::exec(const std::string& command, int timeout_secs) {
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    // Open a new exec channel (no PTY)
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open exec channel", ChannelError::Channel};
        }
        if (std::chrono::steady_clock::now() > deadline) {
            return SSHResult{-1, "", "Timed out opening exec channel", ChannelError::Timeout};
        }
        wait_socket(session_, sock_, 100);
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket(session_, sock_, 100);
    }
    if (rc != 0) {
        libssh2_channel_free(channel);
        return SSHResult{-1, "", "Failed to exec command on channel", ChannelError::Channel};
    }

    // Drain stdout and stderr until EOF
    std::string output;
    std::string errors;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = false;

    while (true) {
        bool progress = false;

        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            progress = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            libssh2_channel_free(channel);
            return SSHResult{-1, output, "SSH channel read error", ChannelError::Channel};
        }

        ssize_t e = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (e > 0) {
            errors.append(buf, static_cast<size_t>(e));
            progress = true;
        }

        if (!progress) {
            if (libssh2_channel_eof(channel)) break;
            if (std::chrono::steady_clock::now() > deadline) {
                timed_out = true;
                break;
            }
            wait_socket(session_, sock_, 100);
        }
    }

    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket(session_, sock_, 100);
    }
    int exit_status = (rc == 0) ? libssh2_channel_get_exit_status(channel) : -1;
    libssh2_channel_free(channel);

    if (timed_out) {
        return SSHResult{-1, output,
                         "Command timed out after " + std::to_string(effective_timeout) + "s",
                         ChannelError::Timeout};
    }
    return SSHResult{exit_status, output, errors};
}

std::unique_ptr<SSHConnection> make_libssh2_connection(const SessionTarget& target) {
    return std::make_unique<LibSSH2Connection>(target);
}
