#pragma once

#include <optional>
#include <string>

// Whether operations that need root may run on a host.
//   Skip      - never run them; they become logged no-ops
//   NoPasswd  - run them through `sudo -n` (passwordless sudo configured)
enum class PrivilegePolicy {
    Skip,
    NoPasswd,
};

// Throws ConfigurationError on an unknown name.
PrivilegePolicy parse_privilege_policy(const std::string& name);
std::string to_string(PrivilegePolicy policy);

// True when an operation with the given requirement may run under `policy`.
// Unprivileged operations are always allowed.
bool check_privilege_policy(bool requires_privilege, PrivilegePolicy policy);

// Host override wins over the process-wide default.
inline PrivilegePolicy resolve_privilege_policy(const std::optional<PrivilegePolicy>& host_override,
                                                PrivilegePolicy global_default) {
    return host_override ? *host_override : global_default;
}
