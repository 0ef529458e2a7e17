#pragma once

#include <filesystem>
#include <string>

namespace stratum {

// Copies the contents of one directory tree into another, preserving
// ownership, modes, links and special files (cp -a). Returns false and fills
// error on failure.
bool copyTree(const std::filesystem::path &from, const std::filesystem::path &to,
              std::string *error);

/**
 * Working filesystem of an image under construction.
 *
 * Layout inside imageDir:
 * - rootfs/   committed state, visible to identity resolution
 * - staging/  copy of rootfs while a transactional step runs
 *
 * Failures throw BuildError (kind Workspace).
 */
class RootfsWorkspace {
public:
    explicit RootfsWorkspace(std::filesystem::path imageDir);

    void initialize(const std::filesystem::path &baseRootfs);

    const std::filesystem::path &imageDir() const { return m_imageDir; }
    const std::filesystem::path &rootfs() const { return m_rootfs; }

    std::filesystem::path beginLayer();
    void commitLayer();
    void abortLayer();
    bool hasOpenLayer() const { return m_layerOpen; }

    // Drops the whole image directory, committed state included.
    void discard();

private:
    std::filesystem::path m_imageDir;
    std::filesystem::path m_rootfs;
    std::filesystem::path m_staging;
    bool m_layerOpen = false;
};

} // namespace stratum
