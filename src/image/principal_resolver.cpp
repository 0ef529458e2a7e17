#include "image/principal_resolver.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace stratum {

namespace {

struct PasswdEntry {
    std::string name;
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::string home;
};

std::vector<std::string> splitFields(const std::string &line, char separator)
{
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, separator)) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == separator) {
        fields.emplace_back();
    }
    return fields;
}

std::optional<uint32_t> parseId(const std::string &value)
{
    if (value.empty() || value.size() > 10) {
        return std::nullopt;
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    const unsigned long long parsed = std::stoull(value);
    if (parsed > 0xFFFFFFFFULL) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(parsed);
}

constexpr int kMaxSymlinkHops = 40;

// Resolves etc/<name> the way a process chrooted into rootfs would see it:
// absolute symlink targets and ".." never leave rootfs.
std::optional<std::filesystem::path> etcFile(const std::string &rootfs, const char *name)
{
    namespace fs = std::filesystem;
    const fs::path root(rootfs.empty() ? "/" : rootfs);

    std::vector<fs::path> pending{fs::path("etc"), fs::path(name)};
    std::vector<fs::path> resolved;
    int hops = 0;

    while (!pending.empty()) {
        const fs::path component = pending.front();
        pending.erase(pending.begin());

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            if (!resolved.empty()) {
                resolved.pop_back();
            }
            continue;
        }

        fs::path current = root;
        for (const auto &part : resolved) {
            current /= part;
        }
        current /= component;

        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(current, ec))) {
            resolved.push_back(component);
            continue;
        }
        if (++hops > kMaxSymlinkHops) {
            return std::nullopt;
        }
        const fs::path target = fs::read_symlink(current, ec);
        if (ec) {
            return std::nullopt;
        }
        if (target.is_absolute()) {
            resolved.clear();
        }
        std::vector<fs::path> expanded;
        for (const auto &part : target.relative_path()) {
            expanded.push_back(part);
        }
        pending.insert(pending.begin(), expanded.begin(), expanded.end());
    }

    fs::path result = root;
    for (const auto &part : resolved) {
        result /= part;
    }
    return result;
}

// passwd(5): name:password:uid:gid:gecos:home:shell
std::vector<PasswdEntry> readPasswd(const std::string &rootfs)
{
    std::vector<PasswdEntry> entries;
    const auto path = etcFile(rootfs, "passwd");
    if (!path.has_value()) {
        return entries;
    }
    std::ifstream file(*path);
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto fields = splitFields(line, ':');
        if (fields.size() < 4) {
            continue;
        }
        const auto uid = parseId(fields[2]);
        const auto gid = parseId(fields[3]);
        if (!uid.has_value() || !gid.has_value()) {
            continue;
        }
        PasswdEntry entry;
        entry.name = fields[0];
        entry.uid = *uid;
        entry.gid = *gid;
        entry.home = fields.size() > 5 && !fields[5].empty() ? fields[5] : "/";
        entries.push_back(std::move(entry));
    }
    return entries;
}

// group(5): name:password:gid:members
std::optional<uint32_t> lookupGroup(const std::string &rootfs, const std::string &group)
{
    const auto path = etcFile(rootfs, "group");
    if (!path.has_value()) {
        return std::nullopt;
    }
    std::ifstream file(*path);
    std::string line;
    while (std::getline(file, line)) {
        const auto fields = splitFields(line, ':');
        if (fields.size() < 3 || fields[0] != group) {
            continue;
        }
        return parseId(fields[2]);
    }
    return std::nullopt;
}

} // namespace

std::optional<Principal> resolvePrincipal(const std::string &rootfs,
                                          const std::string &identity)
{
    const size_t colon = identity.find(':');
    const std::string user = identity.substr(0, colon);
    const std::string group = colon == std::string::npos
        ? std::string()
        : identity.substr(colon + 1);

    if (user.empty() || (colon != std::string::npos && group.empty())) {
        return std::nullopt;
    }

    const auto entries = readPasswd(rootfs);
    const auto numericUser = parseId(user);

    std::optional<Principal> principal;
    for (const auto &entry : entries) {
        const bool matches = numericUser.has_value()
            ? entry.uid == *numericUser
            : entry.name == user;
        if (matches) {
            principal = Principal{entry.name, entry.uid, entry.gid, entry.home};
            break;
        }
    }

    // An unlisted numeric uid is still a valid principal.
    if (!principal.has_value() && numericUser.has_value()) {
        principal = Principal{user, *numericUser, 0, "/"};
    }

    if (!principal.has_value()) {
        SLOG_DEBUG(QStringLiteral("PrincipalResolver"),
                   QStringLiteral("resolvePrincipal"),
                   QStringLiteral("principal_not_found"),
                   QStringLiteral("identity_resolution"),
                   QStringLiteral("passwd_lookup"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"rootfs", rootfs}, {"identity", identity}}));
        return std::nullopt;
    }

    if (!group.empty()) {
        auto gid = parseId(group);
        if (!gid.has_value()) {
            gid = lookupGroup(rootfs, group);
        }
        if (!gid.has_value()) {
            return std::nullopt;
        }
        principal->gid = *gid;
    }

    return principal;
}

} // namespace stratum
