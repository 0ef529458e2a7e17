#pragma once

#include <map>
#include <string>

namespace stratum {

/**
 * Read the dpkg status database of a root filesystem.
 *
 * Returns installed packages mapped to their versions, sorted by name.
 * A missing or unreadable database yields an empty map.
 */
std::map<std::string, std::string> readPackageInventory(const std::string &rootfs);

// Parses dpkg status content directly; used by readPackageInventory.
std::map<std::string, std::string> parseDpkgStatus(const std::string &content);

} // namespace stratum
