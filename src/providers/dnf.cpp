#include "dnf.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>

// check-update exits 100 when updates are available, 0 when there are none
static constexpr int CHECK_UPDATE_AVAILABLE = 100;

DnfProvider::DnfProvider(Flavor flavor)
    : flavor_(flavor), bin_(flavor == Flavor::Dnf ? "dnf" : "yum") {}

const ProviderInfo& DnfProvider::info() const {
    static const ProviderInfo dnf_info{"dnf", "Fedora/RHEL/CentOS Derivatives", false, false, {}};
    static const ProviderInfo yum_info{"yum", "RHEL/CentOS 7 and earlier", false, false, {}};
    return flavor_ == Flavor::Dnf ? dnf_info : yum_info;
}

bool DnfProvider::reposync(SSHConnection& cx) {
    fleet_log_debug(fmt::format("Synchronizing {} repositories", bin_));
    auto result = cx.run(bin_ + " makecache --quiet");
    raise_if_offline(cx, result);

    if (result.failed()) {
        fleet_log_error(fmt::format("Failed to synchronize {} repositories on {}: {}",
                                    bin_, cx.target(), trimmed(result.stderr_data)));
        return false;
    }
    return true;
}

std::vector<Update> DnfProvider::get_updates(SSHConnection& cx) {
    std::vector<Update> updates;

    auto security = security_updates(cx);

    auto result = cx.run(bin_ + " check-update --quiet");
    raise_if_offline(cx, result);

    if (result.exit_code == 0) {
        fleet_log_debug("No updates available");
        return updates;
    }
    if (result.exit_code != CHECK_UPDATE_AVAILABLE) {
        throw DataRefreshError(
            fmt::format("Failed to retrieve updates from {}: {}", bin_, trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    auto rows = parse_check_update(result.stdout_data);

    std::vector<std::string> names;
    for (const auto& row : rows) names.push_back(std::get<0>(row));
    auto current = installed_versions(cx, names);

    for (const auto& [name, version, source] : rows) {
        Update update;
        update.name = name;
        auto it = current.find(name);
        update.current_version = it != current.end() ? it->second : "(none)";
        update.new_version = version;
        update.source = source;
        update.security = security.count(name) > 0;
        updates.push_back(std::move(update));
    }
    return updates;
}

std::set<std::string> DnfProvider::security_updates(SSHConnection& cx) {
    std::set<std::string> names;

    auto result = cx.run(bin_ + " check-update --security --quiet");
    raise_if_offline(cx, result);

    if (result.exit_code == 0) {
        fleet_log_debug("No security updates available");
        return names;
    }
    if (result.exit_code != CHECK_UPDATE_AVAILABLE) {
        throw DataRefreshError(
            fmt::format("Failed to retrieve security updates from {}: {}", bin_,
                        trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    for (const auto& row : parse_check_update(result.stdout_data)) {
        names.insert(std::get<0>(row));
    }
    fleet_log_info(fmt::format("Found {} security updates", names.size()));
    return names;
}

std::map<std::string, std::string> DnfProvider::installed_versions(
        SSHConnection& cx, const std::vector<std::string>& names) {
    std::map<std::string, std::string> versions;
    if (names.empty()) return versions;

    std::string cmd = bin_ + " list installed --quiet";
    for (const auto& n : names) cmd += " " + n;

    auto result = cx.run(cmd);
    raise_if_offline(cx, result);
    if (result.failed()) {
        throw DataRefreshError(
            fmt::format("Failed to get installed versions: {}", trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    std::map<std::string, int> seen;
    for (const auto& line : split_lines(result.stdout_data)) {
        auto row = parse_line(line);
        if (!row) continue;
        const auto& name = std::get<0>(*row);
        // Multi-version packages (kernels): keep the last, flag the rest
        versions[name] = ++seen[name] > 1 ? std::get<1>(*row) + " (+)" : std::get<1>(*row);
    }
    return versions;
}

std::optional<std::tuple<std::string, std::string, std::string>>
DnfProvider::parse_line(const std::string& line) {
    auto parts = split_words(line);
    if (parts.size() < 3) return std::nullopt;
    return std::make_tuple(parts[0], parts[1], parts[2]);
}

std::vector<std::tuple<std::string, std::string, std::string>>
DnfProvider::parse_check_update(const std::string& output) {
    std::vector<std::tuple<std::string, std::string, std::string>> rows;
    for (const auto& line : split_lines(output)) {
        if (line.rfind("Obsoleting Packages", 0) == 0) break;
        if (line.rfind("Security:", 0) == 0) continue;

        auto row = parse_line(line);
        if (!row) {
            fleet_log_debug("dnf: skipping line: " + line);
            continue;
        }
        rows.push_back(std::move(*row));
    }
    return rows;
}
