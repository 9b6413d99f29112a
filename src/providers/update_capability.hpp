#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

class SSHConnection;

// Static facts about a provider, readable without running anything.
struct ProviderInfo {
    std::string name;
    std::string description;
    bool reposync_requires_sudo = false;
    bool get_updates_requires_sudo = false;
    std::vector<std::string> sudo_commands;  // for sudoers snippets
};

// A package manager on a remote host.
class UpdateCapability {
public:
    virtual ~UpdateCapability() = default;

    virtual const ProviderInfo& info() const = 0;

    // Refresh the package catalog. Returns false if the remote tool failed.
    virtual bool reposync(SSHConnection& cx) = 0;

    // Pending updates, in the order the tool reports them. Empty when
    // nothing is pending; throws DataRefreshError when the query fails.
    virtual std::vector<Update> get_updates(SSHConnection& cx) = 0;
};
