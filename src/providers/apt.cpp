#include "apt.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>
#include <regex>

const ProviderInfo& AptProvider::info() const {
    static const ProviderInfo info{
        "apt",
        "Debian/Ubuntu Derivatives",
        true,
        false,
        {"/usr/bin/apt-get update"},
    };
    return info;
}

bool AptProvider::reposync(SSHConnection& cx) {
    fleet_log_debug("Synchronizing apt repositories");
    auto result = cx.sudo("/usr/bin/apt-get update");
    raise_if_offline(cx, result);

    if (result.failed()) {
        fleet_log_error(fmt::format("apt-get update failed on {}: {}", cx.target(),
                                    trimmed(result.stderr_data)));
        return false;
    }
    return true;
}

std::vector<Update> AptProvider::get_updates(SSHConnection& cx) {
    auto result = cx.run("apt-get dist-upgrade -s");
    raise_if_offline(cx, result);

    if (result.failed()) {
        throw DataRefreshError(
            fmt::format("Failed to get updates from apt-get: {}", trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }

    std::vector<Update> updates;
    for (const auto& line : split_lines(result.stdout_data)) {
        if (line.rfind("Inst", 0) != 0) continue;

        auto update = parse_line(line);
        if (!update) {
            fleet_log_debug("apt: could not parse line: " + line);
            continue;
        }
        updates.push_back(std::move(*update));
    }
    return updates;
}

std::optional<Update> AptProvider::parse_line(const std::string& line) {
    // Inst <name> [<current>] (<new> <source> [<arch>])
    static const std::regex pattern(
        R"(^Inst\s+(\S+)\s+\[([^\]]+)\]\s+\((\S+)\s+(.+?)\s+\[[^\]]+\]\))");

    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }

    Update update;
    update.name = trimmed(match[1].str());
    update.current_version = trimmed(match[2].str());
    update.new_version = trimmed(match[3].str());
    update.source = trimmed(match[4].str());
    update.security = to_lower(*update.source).find("security") != std::string::npos;
    return update;
}
