#include "image/package_inventory.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace stratum {

namespace {

constexpr const char *kDpkgStatusPath = "var/lib/dpkg/status";

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct Stanza {
    std::string package;
    std::string status;
    std::string version;
};

void flushStanza(Stanza &stanza, std::map<std::string, std::string> &installed)
{
    // "install ok installed"; half-installed and config-files do not count.
    if (!stanza.package.empty() && endsWith(stanza.status, " installed")) {
        installed[stanza.package] = stanza.version;
    }
    stanza = Stanza{};
}

} // namespace

std::map<std::string, std::string> parseDpkgStatus(const std::string &content)
{
    std::map<std::string, std::string> installed;
    Stanza stanza;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            flushStanza(stanza, installed);
            continue;
        }
        // Continuation lines belong to multi-line fields such as Description.
        if (std::isspace(static_cast<unsigned char>(line.front()))) {
            continue;
        }

        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string field = line.substr(0, colon);
        const std::string value = trim(line.substr(colon + 1));
        if (field == "Package") {
            stanza.package = value;
        } else if (field == "Status") {
            stanza.status = value;
        } else if (field == "Version") {
            stanza.version = value;
        }
    }
    flushStanza(stanza, installed);

    return installed;
}

std::map<std::string, std::string> readPackageInventory(const std::string &rootfs)
{
    const std::filesystem::path path = std::filesystem::path(rootfs) / kDpkgStatusPath;
    std::ifstream file(path);
    if (!file.is_open()) {
        SLOG_DEBUG(QStringLiteral("PackageInventory"),
                   QStringLiteral("readPackageInventory"),
                   QStringLiteral("dpkg_status_missing"),
                   QStringLiteral("image_inventory"),
                   QStringLiteral("file_open"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.string()}}));
        return {};
    }

    std::ostringstream content;
    content << file.rdbuf();
    auto installed = parseDpkgStatus(content.str());

    SLOG_DEBUG(QStringLiteral("PackageInventory"),
               QStringLiteral("readPackageInventory"),
               QStringLiteral("dpkg_status_read"),
               QStringLiteral("image_inventory"),
               QStringLiteral("dpkg_status"),
               stratum::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.string()}, {"packages", installed.size()}}));
    return installed;
}

} // namespace stratum
