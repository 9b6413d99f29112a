#pragma once

#include <optional>
#include <set>
#include "update_capability.hpp"

// FreeBSD pkg(8). Repositories sync on every query, so reposync is a
// no-op. Security classification comes from `pkg audit`.
class FreeBSDPkgProvider : public UpdateCapability {
public:
    const ProviderInfo& info() const override;
    bool reposync(SSHConnection& cx) override;
    std::vector<Update> get_updates(SSHConnection& cx) override;

    // Parse "\tname: 1.0 -> 1.1". `vulnerable` holds "name-version" entries.
    static std::optional<Update> parse_line(const std::string& line,
                                            const std::set<std::string>& vulnerable);
};
