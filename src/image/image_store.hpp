#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace stratum {

// ImageStore is the SQLite access layer for images and their tags. Image
// filesystems live next to the database under images/<id>/rootfs.
class ImageStore {
public:
    explicit ImageStore(const std::filesystem::path &stateDir);
    ~ImageStore();

    const std::filesystem::path &stateDir() const;
    std::filesystem::path imageDir(const std::string &id) const;

    // Writes the image row and its tags in one transaction.
    void addImage(const ImageRecord &image, const std::vector<std::string> &tags = {});

    // Points reference at imageId, moving the tag if it already exists.
    void tagImage(const std::string &reference, const std::string &imageId);

    // Accepts a tag ("repo", "repo:tag") or an image id prefix of 12+ characters.
    std::optional<ImageRecord> findByReference(const std::string &reference) const;
    std::optional<ImageRecord> getImage(const std::string &id) const;
    std::vector<ImageRecord> listImages() const;

    // Removes the tag; the image and its filesystem go with the last tag.
    // An id or id prefix deletes an image that no tag references.
    // Returns true when the image itself was deleted.
    bool removeTag(const std::string &reference);

    // Copies an unpacked root filesystem into the store as a base image.
    ImageRecord importImage(const std::string &reference,
                            const std::filesystem::path &rootfs,
                            const std::string &defaultUser);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace stratum
