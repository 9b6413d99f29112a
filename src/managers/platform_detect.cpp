#include "platform_detect.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>

static const std::array<const char*, 3> SUPPORTED_PLATFORMS = {"linux", "freebsd", "openbsd"};
static const std::array<const char*, 4> SUPPORTED_FLAVORS = {"ubuntu", "debian", "rhel", "fedora"};

static bool is_supported_flavor(const std::string& flavor) {
    return std::find(SUPPORTED_FLAVORS.begin(), SUPPORTED_FLAVORS.end(), flavor) !=
           SUPPORTED_FLAVORS.end();
}

// Run a probe command; transport failures become OfflineHostError.
static SSHResult probe(SSHConnection& cx, const std::string& cmd) {
    auto result = cx.run(cmd);
    raise_if_offline(cx, result);
    return result;
}

bool is_supported_os(const std::string& os) {
    return std::find(SUPPORTED_PLATFORMS.begin(), SUPPORTED_PLATFORMS.end(), os) !=
           SUPPORTED_PLATFORMS.end();
}

std::string os_release_value(const std::string& line) {
    auto eq = line.find('=');
    std::string value = trimmed(eq == std::string::npos ? line : line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

std::string os_detect(SSHConnection& cx) {
    auto result = probe(cx, "uname -s");
    if (result.failed()) {
        // No uname: not a Unix-like system
        throw UnsupportedPlatformError(
            fmt::format("Unable to detect OS: uname -s failed ({})", trimmed(result.stderr_data)),
            result.stdout_data, result.stderr_data);
    }
    return to_lower(trimmed(result.stdout_data));
}

std::string flavor_detect(SSHConnection& cx, const std::string& os) {
    if (!is_supported_os(os)) {
        throw UnsupportedPlatformError("Unsupported platform: " + os);
    }

    // BSDs have no flavors that matter
    if (os == "freebsd" || os == "openbsd") {
        return os;
    }

    auto result_id = probe(cx, "grep ^ID= /etc/os-release");
    auto result_like = probe(cx, "grep ^ID_LIKE= /etc/os-release");

    if (result_id.failed()) {
        throw DataRefreshError("Failed to detect OS flavor via os-release identifier.",
                               result_id.stdout_data, result_id.stderr_data);
    }

    std::string id = to_lower(os_release_value(trimmed(result_id.stdout_data)));
    if (is_supported_flavor(id)) {
        return id;
    }

    if (result_like.failed()) {
        throw UnsupportedPlatformError("Unknown flavor " + id + ", no matching ID or ID_LIKE.");
    }

    // First supported entry of ID_LIKE is good enough
    for (const auto& like : split_words(os_release_value(trimmed(result_like.stdout_data)))) {
        std::string l = to_lower(like);
        if (is_supported_flavor(l)) return l;
    }

    throw UnsupportedPlatformError("Unsupported OS flavor detected: " + id);
}

std::string version_detect(SSHConnection& cx, const std::string& flavor) {
    std::string cmd;
    bool os_release = false;

    if (flavor == "ubuntu") {
        cmd = "lsb_release -s -r";
    } else if (flavor == "debian") {
        cmd = "cat /etc/debian_version";
    } else if (flavor == "rhel" || flavor == "fedora") {
        cmd = "grep ^VERSION_ID= /etc/os-release";
        os_release = true;
    } else if (flavor == "freebsd") {
        cmd = "/bin/freebsd-version -u";
    } else if (flavor == "openbsd") {
        cmd = "uname -r";
    } else {
        throw UnsupportedPlatformError("Unsupported OS flavor: " + flavor);
    }

    auto result = probe(cx, cmd);
    if (result.failed()) {
        throw DataRefreshError(fmt::format("Failed to query version info for {}", flavor),
                               result.stdout_data, result.stderr_data);
    }

    std::string out = trimmed(result.stdout_data);
    return os_release ? os_release_value(out) : out;
}

std::string package_manager_detect(SSHConnection& cx, const std::string& flavor) {
    if (flavor == "ubuntu" || flavor == "debian") return "apt";
    if (flavor == "freebsd") return "pkg";
    if (flavor == "openbsd") return "pkg_add";

    if (flavor == "rhel" || flavor == "fedora") {
        if (probe(cx, "command -v dnf").success()) return "dnf";
        if (probe(cx, "command -v yum").success()) return "yum";
        throw UnsupportedPlatformError("Neither dnf nor yum found on " + flavor + " host");
    }

    throw UnsupportedPlatformError("Unsupported OS flavor: " + flavor);
}

HostInfo platform_detect(SSHConnection& cx) {
    HostInfo info;
    info.os = os_detect(cx);

    if (!is_supported_os(info.os)) {
        fleet_log_warn(fmt::format("{}: unsupported platform '{}'", cx.target(), info.os));
        info.supported = false;
        return info;
    }

    std::string flavor = flavor_detect(cx, info.os);
    info.flavor = flavor;
    info.version = version_detect(cx, flavor);
    info.package_manager = package_manager_detect(cx, flavor);
    info.supported = true;
    return info;
}
