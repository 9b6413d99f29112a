#pragma once

#include <optional>
#include "update_capability.hpp"

// OpenBSD pkg_add(1). No security classification is available, so every
// update is reported as a normal one.
class OpenBSDPkgProvider : public UpdateCapability {
public:
    const ProviderInfo& info() const override;
    bool reposync(SSHConnection& cx) override;
    std::vector<Update> get_updates(SSHConnection& cx) override;

    // Parse "Update candidates: foo-1.0 -> foo-1.1". Returns nullopt when
    // the line does not parse, the name changes, or the version is equal.
    static std::optional<Update> parse_line(const std::string& line);
};
