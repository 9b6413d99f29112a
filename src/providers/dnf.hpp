#pragma once

#include <map>
#include <optional>
#include <set>
#include <tuple>
#include "update_capability.hpp"

// Fedora/RHEL family. The same commands work with yum on older releases;
// Flavor only picks the binary.
class DnfProvider : public UpdateCapability {
public:
    enum class Flavor { Dnf, Yum };

    explicit DnfProvider(Flavor flavor = Flavor::Dnf);

    const ProviderInfo& info() const override;
    bool reposync(SSHConnection& cx) override;
    std::vector<Update> get_updates(SSHConnection& cx) override;

    // "<name.arch> <version> <repo>" → (name.arch, version, repo)
    static std::optional<std::tuple<std::string, std::string, std::string>>
    parse_line(const std::string& line);

    // Parse check-update output into (name.arch, version, repo) rows,
    // stopping at the "Obsoleting Packages" section.
    static std::vector<std::tuple<std::string, std::string, std::string>>
    parse_check_update(const std::string& output);

private:
    std::set<std::string> security_updates(SSHConnection& cx);
    std::map<std::string, std::string> installed_versions(SSHConnection& cx,
                                                          const std::vector<std::string>& names);

    Flavor flavor_;
    std::string bin_;
};
