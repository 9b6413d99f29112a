#include "freebsd_pkg.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>
#include <regex>
#include <sstream>

const ProviderInfo& FreeBSDPkgProvider::info() const {
    static const ProviderInfo info{"pkg", "FreeBSD", false, false, {}};
    return info;
}

bool FreeBSDPkgProvider::reposync(SSHConnection& /*cx*/) {
    fleet_log_debug("FreeBSD pkg does not require explicit repository synchronization");
    return true;
}

std::vector<Update> FreeBSDPkgProvider::get_updates(SSHConnection& cx) {
    // pkg audit exits non-zero when it finds vulnerable packages; only
    // stderr output means the audit itself failed.
    auto audit = cx.run("pkg audit -q");
    raise_if_offline(cx, audit);
    if (audit.failed() && !trimmed(audit.stderr_data).empty()) {
        throw DataRefreshError(
            fmt::format("Failed to get vulnerable packages from pkg: {}", trimmed(audit.stderr_data)),
            audit.stdout_data, audit.stderr_data);
    }

    std::set<std::string> vulnerable;
    for (const auto& line : split_lines(audit.stdout_data)) {
        vulnerable.insert(line);
    }
    fleet_log_debug(fmt::format("Found {} vulnerable packages", vulnerable.size()));

    // Dry-run upgrade exits non-zero when there is something to upgrade
    auto result = cx.run("pkg upgrade -qn");
    raise_if_offline(cx, result);
    if (result.failed() && !trimmed(result.stderr_data).empty()) {
        throw DataRefreshError(
            fmt::format("Failed to get updates from pkg: {}", trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    std::vector<Update> updates;
    std::istringstream in(result.stdout_data);
    std::string line;
    while (std::getline(in, line)) {
        // Package rows are indented; headers and summaries are not
        if (line.empty() || (line[0] != ' ' && line[0] != '\t')) continue;

        auto update = parse_line(line, vulnerable);
        if (!update) {
            fleet_log_debug("pkg: skipping garbage line: " + line);
            continue;
        }
        updates.push_back(std::move(*update));
    }
    return updates;
}

std::optional<Update> FreeBSDPkgProvider::parse_line(const std::string& line,
                                                     const std::set<std::string>& vulnerable) {
    static const std::regex pattern(R"(^\s*(\S+):\s+(\S+)\s+->\s+(\S+)\s*$)");

    std::smatch match;
    if (!std::regex_match(line, match, pattern)) {
        return std::nullopt;
    }

    Update update;
    update.name = match[1].str();
    update.current_version = match[2].str();
    update.new_version = match[3].str();
    update.source = "Packages Mirror";
    update.security = vulnerable.count(update.name + "-" + update.current_version) > 0;
    return update;
}
