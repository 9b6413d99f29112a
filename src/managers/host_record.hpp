#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/privilege.hpp>
#include <core/types.hpp>
#include <providers/update_capability.hpp>
#include <ssh/remote_session.hpp>

using CapabilityFactory = std::function<std::unique_ptr<UpdateCapability>(const std::string&)>;

// One managed host: identity, discovered platform facts, pending updates,
// its session and its package-manager binding.
//
// State is (online, supported). package_manager is only set while both are
// true. All mutable fields are written by this host's own operations; the
// reaper only ever touches session().
class HostRecord {
public:
    HostRecord(const HostConfig& config, const FleetOptions& options,
               ConnectionFactory connection_factory = nullptr,
               CapabilityFactory capability_factory = nullptr);
    ~HostRecord();

    HostRecord(const HostRecord&) = delete;
    HostRecord& operator=(const HostRecord&) = delete;

    // ── Operations ─────────────────────────────────────────────

    // Probe reachability, then identify the platform and bind a provider.
    void discover();

    // Refresh the remote package catalog.
    void sync_repos();

    // Replace updates with what the provider reports now.
    void refresh_updates();

    // Run a trivial command. Sets online either way; throws
    // OfflineHostError on failure only when raise_on_error is set.
    bool ping(bool raise_on_error = false);

    // Close the session. clear_handle also drops the connection object.
    void close(bool clear_handle = true);

    // ── Identity ───────────────────────────────────────────────

    const std::string& name() const { return name_; }
    const std::string& address() const { return address_; }
    int port() const { return port_; }
    const std::optional<std::string>& username() const { return username_; }
    const std::optional<std::string>& description() const { return description_; }
    int connect_timeout() const { return connect_timeout_; }

    const std::optional<PrivilegePolicy>& privilege_override() const { return privilege_override_; }
    PrivilegePolicy privilege_policy() const;

    // ── Discovered state ───────────────────────────────────────

    const std::optional<std::string>& os() const { return os_; }
    const std::optional<std::string>& version() const { return version_; }
    const std::optional<std::string>& flavor() const { return flavor_; }
    const std::optional<std::string>& package_manager() const { return package_manager_; }
    bool supported() const { return supported_; }
    bool online() const { return online_; }
    const std::vector<Update>& updates() const { return updates_; }
    std::vector<Update> security_updates() const;
    const std::optional<TimePoint>& last_refresh() const { return last_refresh_; }

    // Supported and never refreshed, or refreshed longer ago than the
    // stale threshold. Unsupported hosts are never stale.
    bool is_stale(TimePoint now = Clock::now()) const;

    RemoteSession& session() { return session_; }
    UpdateCapability* capability() const { return capability_.get(); }

    std::string str() const;

    // ── State restore ──────────────────────────────────────────
    // Used when rebuilding a host from saved state, and by tests.

    void set_online(bool online) { online_ = online; }
    void set_last_refresh(std::optional<TimePoint> when) { last_refresh_ = when; }
    void apply_platform(const HostInfo& info);
    void bind_capability(std::unique_ptr<UpdateCapability> capability);

private:
    class SessionGuard;

    bool probe(bool raise_on_error);
    void mark_unsupported(const std::optional<std::string>& os);
    void require_capability(const char* operation);

    std::string name_;
    std::string address_;
    int port_;
    std::optional<std::string> username_;
    std::optional<std::string> description_;
    int connect_timeout_;
    std::optional<PrivilegePolicy> privilege_override_;

    const FleetOptions& options_;
    CapabilityFactory capability_factory_;

    std::optional<std::string> os_;
    std::optional<std::string> version_;
    std::optional<std::string> flavor_;
    std::optional<std::string> package_manager_;
    bool supported_ = true;
    bool online_ = false;
    std::vector<Update> updates_;
    std::optional<TimePoint> last_refresh_;

    RemoteSession session_;
    std::unique_ptr<UpdateCapability> capability_;
};
