#include "host_record.hpp"
#include "platform_detect.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <providers/provider_factory.hpp>
#include <ssh/libssh2_connection.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <chrono>

// Closes the session on every exit path unless sessions are reused.
class HostRecord::SessionGuard {
public:
    explicit SessionGuard(HostRecord& host) : host_(host) {}
    ~SessionGuard() {
        if (host_.options_.session_reuse) return;
        try {
            host_.session_.close(true);
        } catch (const std::exception& e) {
            fleet_log_warn(fmt::format("{}: error during session cleanup: {}", host_.name_, e.what()));
        }
    }

private:
    HostRecord& host_;
};

static SessionTarget make_target(const HostConfig& config, const FleetOptions& options) {
    SessionTarget target;
    target.host = config.ip;
    target.port = config.port;
    target.timeout = config.connect_timeout.value_or(options.default_timeout);
    target.ssh_key_path = config.ssh_key_path;

    // Host username, then the configured default, then whoever runs us
    if (config.username) {
        target.user = *config.username;
    } else if (options.default_username) {
        target.user = *options.default_username;
    } else {
        target.user = local_username();
    }
    return target;
}

HostRecord::HostRecord(const HostConfig& config, const FleetOptions& options,
                       ConnectionFactory connection_factory,
                       CapabilityFactory capability_factory)
    : name_(config.name),
      address_(config.ip),
      port_(config.port),
      username_(config.username),
      description_(config.description),
      connect_timeout_(config.connect_timeout.value_or(options.default_timeout)),
      privilege_override_(config.sudo_policy),
      options_(options),
      capability_factory_(capability_factory ? std::move(capability_factory)
                                             : CapabilityFactory(&ProviderFactory::create)),
      session_(make_target(config, options),
               connection_factory ? std::move(connection_factory)
                                  : ConnectionFactory(&make_libssh2_connection)) {}

HostRecord::~HostRecord() = default;

PrivilegePolicy HostRecord::privilege_policy() const {
    return resolve_privilege_policy(privilege_override_, options_.default_privilege_policy);
}

// ── Discovery ───────────────────────────────────────────────

void HostRecord::discover() {
    SessionGuard guard(*this);

    // Reachability first. A probe failure is held, not thrown; the
    // identification outcome decides what happens to it.
    std::exception_ptr probe_error;
    bool probe_ok = false;
    try {
        probe_ok = probe(true);
    } catch (const std::exception& e) {
        fleet_log_debug(fmt::format("{}: reachability probe failed: {}", name_, e.what()));
        probe_error = std::current_exception();
    }

    HostInfo info;
    try {
        auto cx = session_.acquire();
        info = platform_detect(*cx);
    } catch (const UnsupportedPlatformError& e) {
        fleet_log_warn(fmt::format("{}: {}", name_, e.what()));
        mark_unsupported(std::nullopt);
        online_ = true;
        return;
    } catch (const OfflineHostError& e) {
        online_ = false;
        fleet_log_error(fmt::format("{}: host is offline: {}", name_, e.what()));
        if (probe_error) std::rethrow_exception(probe_error);
        throw;
    } catch (const DataRefreshError& e) {
        online_ = false;
        fleet_log_error(fmt::format("{}: platform discovery failed: {}", name_, e.what()));
        throw;
    }

    if (!info.supported) {
        mark_unsupported(info.os);
        online_ = true;
        return;
    }

    if (!probe_ok) {
        fleet_log_warn(fmt::format(
            "{}: reachability probe failed but platform discovery succeeded, "
            "treating host as online", name_));
    }
    apply_platform(info);
    online_ = true;
}

void HostRecord::apply_platform(const HostInfo& info) {
    if (!info.supported) {
        mark_unsupported(info.os);
        return;
    }

    // Build the provider before touching any field so a failing factory
    // leaves the host as it was.
    std::unique_ptr<UpdateCapability> fresh;
    bool rebind = !capability_ || package_manager_ != info.package_manager;
    if (rebind && info.package_manager) {
        fresh = capability_factory_(*info.package_manager);
    }

    os_ = info.os;
    version_ = info.version;
    flavor_ = info.flavor;
    package_manager_ = info.package_manager;
    supported_ = true;

    if (fresh) {
        capability_ = std::move(fresh);
        fleet_log_debug(fmt::format("{}: bound {} provider", name_, *package_manager_));
    }
}

void HostRecord::mark_unsupported(const std::optional<std::string>& os) {
    if (os) os_ = os;
    supported_ = false;
    version_.reset();
    flavor_.reset();
    package_manager_.reset();
    capability_.reset();
    fleet_log_info(fmt::format("{}: platform {} is not supported, host will be skipped",
                               name_, os_.value_or("(unknown)")));
}

void HostRecord::bind_capability(std::unique_ptr<UpdateCapability> capability) {
    capability_ = std::move(capability);
}

// ── Package operations ──────────────────────────────────────

void HostRecord::require_capability(const char* operation) {
    if (!online_) {
        throw OfflineHostError(fmt::format("Host {} is offline, cannot {}", name_, operation));
    }
    if (supported_ && !capability_) {
        fleet_log_error(fmt::format("Package manager implementation unavailable for {}", name_));
        throw DataRefreshError(
            fmt::format("Package manager implementation unavailable for {}", name_));
    }
}

void HostRecord::sync_repos() {
    SessionGuard guard(*this);
    require_capability("sync repositories");

    if (!supported_) {
        fleet_log_warn(fmt::format("{}: unsupported platform, skipping repository sync", name_));
        return;
    }

    if (!check_privilege_policy(capability_->info().reposync_requires_sudo, privilege_policy())) {
        fleet_log_warn(fmt::format(
            "{}: repository sync requires sudo and policy is {}, skipping",
            name_, to_string(privilege_policy())));
        return;
    }

    bool ok = false;
    try {
        auto cx = session_.acquire();
        ok = capability_->reposync(*cx);
    } catch (const OfflineHostError&) {
        online_ = false;
        throw;
    }

    if (!ok) {
        throw DataRefreshError(fmt::format("Failed to synchronize repositories on {}", name_));
    }
    fleet_log_info(fmt::format("{}: repositories synchronized", name_));
}

void HostRecord::refresh_updates() {
    SessionGuard guard(*this);
    require_capability("refresh updates");

    if (!supported_) {
        fleet_log_warn(fmt::format("{}: unsupported platform, skipping update refresh", name_));
        return;
    }

    if (!check_privilege_policy(capability_->info().get_updates_requires_sudo,
                                privilege_policy())) {
        fleet_log_warn(fmt::format(
            "{}: update refresh requires sudo and policy is {}, skipping",
            name_, to_string(privilege_policy())));
        last_refresh_ = Clock::now();
        return;
    }

    std::vector<Update> fresh;
    try {
        auto cx = session_.acquire();
        fresh = capability_->get_updates(*cx);
    } catch (const OfflineHostError&) {
        online_ = false;
        throw;
    }

    if (fresh.empty()) {
        fleet_log_info(fmt::format("No updates available for {}", name_));
    } else {
        fleet_log_info(fmt::format("{}: {} updates available", name_, fresh.size()));
    }

    updates_ = std::move(fresh);
    last_refresh_ = Clock::now();
}

// ── Reachability ────────────────────────────────────────────

bool HostRecord::ping(bool raise_on_error) {
    SessionGuard guard(*this);
    return probe(raise_on_error);
}

bool HostRecord::probe(bool raise_on_error) {
    try {
        auto cx = session_.acquire();
        auto result = cx->run("echo ping");
        raise_if_offline(*cx, result);
        if (result.failed()) {
            throw OfflineHostError(
                fmt::format("Ping to {} failed with exit code {}", name_, result.exit_code),
                result.stdout_data, result.stderr_data);
        }
        online_ = true;
        return true;
    } catch (const OfflineHostError& e) {
        online_ = false;
        fleet_log_debug(fmt::format("{}: ping failed: {}", name_, e.what()));
        if (raise_on_error) throw;
        return false;
    } catch (const std::exception& e) {
        online_ = false;
        fleet_log_debug(fmt::format("{}: ping failed: {}", name_, e.what()));
        if (raise_on_error) throw OfflineHostError(e.what());
        return false;
    }
}

void HostRecord::close(bool clear_handle) {
    session_.close(clear_handle);
}

// ── Derived state ───────────────────────────────────────────

std::vector<Update> HostRecord::security_updates() const {
    std::vector<Update> result;
    std::copy_if(updates_.begin(), updates_.end(), std::back_inserter(result),
                 [](const Update& u) { return u.security; });
    return result;
}

bool HostRecord::is_stale(TimePoint now) const {
    if (!supported_) return false;
    if (!last_refresh_) return true;
    return now - *last_refresh_ > std::chrono::seconds(options_.stale_threshold);
}

std::string HostRecord::str() const {
    return fmt::format("{} ({}:{}) [{}, {}, {}, {}], {}",
                       name_, address_, port_,
                       os_.value_or("None"), version_.value_or("None"),
                       flavor_.value_or("None"), package_manager_.value_or("None"),
                       online_ ? "Online" : "Offline");
}
