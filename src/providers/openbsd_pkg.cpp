#include "openbsd_pkg.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>
#include <regex>

const ProviderInfo& OpenBSDPkgProvider::info() const {
    static const ProviderInfo info{"pkg_add", "OpenBSD", false, false, {}};
    return info;
}

bool OpenBSDPkgProvider::reposync(SSHConnection& /*cx*/) {
    fleet_log_debug("OpenBSD pkg_add does not require repository sync");
    return true;
}

std::vector<Update> OpenBSDPkgProvider::get_updates(SSHConnection& cx) {
    auto result = cx.run("/usr/sbin/pkg_add -u -v -x -n");
    raise_if_offline(cx, result);

    if (result.failed()) {
        throw DataRefreshError(
            fmt::format("Failed to query OpenBSD pkg_add updates: {}", trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    std::vector<Update> updates;
    for (const auto& line : split_lines(result.stdout_data)) {
        if (line.rfind("Update candidate", 0) != 0) continue;

        auto update = parse_line(line);
        if (update) updates.push_back(std::move(*update));
    }

    fleet_log_debug(fmt::format("Found {} updates for OpenBSD packages", updates.size()));
    return updates;
}

std::optional<Update> OpenBSDPkgProvider::parse_line(const std::string& line) {
    static const std::regex pattern(
        R"(^Update candidates: ([\w\-.+]+)-([^\s]+) -> ([\w\-.+]+)-([^\s]+)$)");

    std::smatch match;
    if (!std::regex_match(line, match, pattern)) {
        fleet_log_debug("pkg_add: could not parse: " + line);
        return std::nullopt;
    }

    std::string name = match[1].str();
    std::string current = match[2].str();
    std::string new_name = match[3].str();
    std::string new_version = match[4].str();

    if (name != new_name) {
        fleet_log_warn(fmt::format("Unexpected package name change: {} -> {}, skipping",
                                   name, new_name));
        return std::nullopt;
    }
    if (current == new_version) {
        return std::nullopt;
    }

    Update update;
    update.name = name;
    update.current_version = current;
    update.new_version = new_version;
    update.source = "Packages Mirror";
    update.security = false;
    return update;
}
