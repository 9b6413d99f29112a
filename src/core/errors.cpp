#include "errors.hpp"
#include <ssh/connection.hpp>
#include <fmt/format.h>

std::string describe_channel_error(const std::string& target, const SSHResult& result) {
    switch (result.error) {
        case ChannelError::Auth:
            return fmt::format(
                "Auth Failure: could not authenticate to {} ({}). "
                "Check that your key is loaded in ssh-agent or unencrypted, "
                "and that the username is correct.",
                target, result.stderr_data);
        case ChannelError::Timeout:
            return fmt::format("Connection to {} timed out: {}", target, result.stderr_data);
        case ChannelError::Connect:
            return fmt::format("Unable to connect to {}: {}", target, result.stderr_data);
        case ChannelError::Channel:
            return fmt::format("SSH channel error on {}: {}", target, result.stderr_data);
        case ChannelError::None:
            break;
    }
    return fmt::format("{}: no transport error", target);
}

void raise_if_offline(const SSHConnection& cx, const SSHResult& result) {
    if (!result.transport_failed()) return;
    throw OfflineHostError(describe_channel_error(cx.target(), result),
                           result.stdout_data, result.stderr_data);
}
