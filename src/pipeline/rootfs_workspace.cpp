#include "pipeline/rootfs_workspace.hpp"

#include <system_error>
#include <utility>

#include <QProcess>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/logging.hpp"

namespace stratum {

namespace {

[[noreturn]] void workspaceError(const std::string &message)
{
    SLOG_ERROR(QStringLiteral("RootfsWorkspace"),
               QStringLiteral("workspaceError"),
               QStringLiteral("workspace_failure"),
               QStringLiteral("filesystem_operation"),
               QStringLiteral("std_filesystem"),
               stratum::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"message", message}}));
    throw BuildError(BuildErrorKind::Workspace, message);
}

void removeTree(const std::filesystem::path &path)
{
    std::error_code error;
    std::filesystem::remove_all(path, error);
    if (error) {
        workspaceError("cannot remove " + path.string() + ": " + error.message());
    }
}

} // namespace

bool copyTree(const std::filesystem::path &from, const std::filesystem::path &to,
              std::string *error)
{
    std::error_code ec;
    std::filesystem::create_directories(to, ec);
    if (ec) {
        if (error) {
            *error = "cannot create " + to.string() + ": " + ec.message();
        }
        return false;
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(QStringLiteral("cp"),
                  {QStringLiteral("-a"), QStringLiteral("--reflink=auto"),
                   QString::fromStdString((from / ".").string()),
                   QString::fromStdString(to.string())});
    if (!process.waitForStarted()) {
        if (error) {
            *error = "cannot start cp";
        }
        return false;
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(-1)
        || process.exitStatus() != QProcess::NormalExit
        || process.exitCode() != 0) {
        if (error) {
            *error = "copying " + from.string() + " failed: "
                + QString::fromUtf8(process.readAll()).trimmed().toStdString();
        }
        return false;
    }
    return true;
}

RootfsWorkspace::RootfsWorkspace(std::filesystem::path imageDir)
    : m_imageDir(std::move(imageDir))
    , m_rootfs(m_imageDir / "rootfs")
    , m_staging(m_imageDir / "staging")
{
}

void RootfsWorkspace::initialize(const std::filesystem::path &baseRootfs)
{
    if (!std::filesystem::is_directory(baseRootfs)) {
        workspaceError("base filesystem " + baseRootfs.string() + " is not a directory");
    }
    if (std::filesystem::exists(m_rootfs)) {
        workspaceError("workspace " + m_imageDir.string() + " already exists");
    }

    std::string error;
    if (!copyTree(baseRootfs, m_rootfs, &error)) {
        workspaceError(error);
    }
}

std::filesystem::path RootfsWorkspace::beginLayer()
{
    if (m_layerOpen) {
        workspaceError("a layer is already open in " + m_imageDir.string());
    }

    removeTree(m_staging);
    std::string error;
    if (!copyTree(m_rootfs, m_staging, &error)) {
        removeTree(m_staging);
        workspaceError(error);
    }
    m_layerOpen = true;
    return m_staging;
}

void RootfsWorkspace::commitLayer()
{
    if (!m_layerOpen) {
        workspaceError("no open layer to commit in " + m_imageDir.string());
    }

    const std::filesystem::path previous = m_imageDir / "rootfs.previous";
    std::error_code error;
    std::filesystem::rename(m_rootfs, previous, error);
    if (error) {
        workspaceError("cannot retire " + m_rootfs.string() + ": " + error.message());
    }
    std::filesystem::rename(m_staging, m_rootfs, error);
    if (error) {
        // Restore the committed tree.
        std::error_code restoreError;
        std::filesystem::rename(previous, m_rootfs, restoreError);
        workspaceError("cannot commit " + m_staging.string() + ": " + error.message());
    }
    m_layerOpen = false;
    removeTree(previous);
}

void RootfsWorkspace::abortLayer()
{
    m_layerOpen = false;
    removeTree(m_staging);
}

void RootfsWorkspace::discard()
{
    m_layerOpen = false;
    removeTree(m_imageDir);
}

} // namespace stratum
