#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace stratum {

/**
 * Resolve an identity against the passwd and group files of a root filesystem.
 *
 * - rootfs: image root, e.g. "<state>/images/<id>/rootfs"; "/" for the host.
 * - identity: "name", "uid", "name:group" or "uid:gid".
 *
 * Returns std::nullopt when the user or group cannot be resolved.
 */
std::optional<Principal> resolvePrincipal(const std::string &rootfs,
                                          const std::string &identity);

} // namespace stratum
