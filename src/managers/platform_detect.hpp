#pragma once

#include <string>
#include <core/types.hpp>

class SSHConnection;

// Identify the remote platform over an open connection.
//
// Returns HostInfo with supported=false when the OS itself is not one we
// manage. Throws UnsupportedPlatformError when the OS is known but the
// distribution or package manager is not, OfflineHostError when the host
// cannot be reached, and DataRefreshError when a probe command fails.
HostInfo platform_detect(SSHConnection& cx);

// Steps of platform_detect, exposed for tests
std::string os_detect(SSHConnection& cx);
std::string flavor_detect(SSHConnection& cx, const std::string& os);
std::string version_detect(SSHConnection& cx, const std::string& flavor);
std::string package_manager_detect(SSHConnection& cx, const std::string& flavor);

bool is_supported_os(const std::string& os);

// Value of KEY=... from an os-release line, quotes stripped
std::string os_release_value(const std::string& line);
