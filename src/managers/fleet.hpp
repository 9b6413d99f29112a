#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "host_record.hpp"

// The managed hosts, in configuration order, plus the options they share.
// Hosts hold a reference to this fleet's options, so a Fleet never moves.
class Fleet {
public:
    Fleet(const FleetOptions& options, const std::vector<HostConfig>& hosts,
          ConnectionFactory connection_factory = nullptr,
          CapabilityFactory capability_factory = nullptr);

    Fleet(const Fleet&) = delete;
    Fleet& operator=(const Fleet&) = delete;

    const FleetOptions& options() const { return options_; }

    size_t size() const { return hosts_.size(); }
    bool empty() const { return hosts_.empty(); }

    // nullptr when no host has that name
    HostRecord* find(const std::string& name);

    std::vector<HostRecord*> all();

    // Hosts matching `names`, in the order given, each at most once. An
    // empty list selects every host. Throws ConfigurationError naming any unknown host.
    std::vector<HostRecord*> select(const std::vector<std::string>& names);

    // Every host's session, for the reaper
    std::vector<RemoteSession*> sessions();

    // Close every session and drop the handles.
    void close_all();

private:
    FleetOptions options_;
    std::vector<std::unique_ptr<HostRecord>> hosts_;
};
