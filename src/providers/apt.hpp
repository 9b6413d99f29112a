#pragma once

#include <optional>
#include "update_capability.hpp"

// Debian/Ubuntu. Catalog refresh needs root; the update query is a
// simulated dist-upgrade and does not.
class AptProvider : public UpdateCapability {
public:
    const ProviderInfo& info() const override;
    bool reposync(SSHConnection& cx) override;
    std::vector<Update> get_updates(SSHConnection& cx) override;

    // Parse one "Inst ..." line of `apt-get dist-upgrade -s`.
    static std::optional<Update> parse_line(const std::string& line);
};
