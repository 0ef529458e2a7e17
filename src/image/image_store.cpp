#include "image/image_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "descriptor/descriptor_parser.hpp"
#include "image/package_inventory.hpp"
#include "pipeline/rootfs_workspace.hpp"

namespace stratum {

namespace {

constexpr size_t kMinIdPrefixLength = 12;
// Another stratum process may hold the write lock while it records a build.
constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateImagesTable =
    "CREATE TABLE IF NOT EXISTS images ("
    "    id TEXT PRIMARY KEY,"
    "    parent_id TEXT,"
    "    rootfs TEXT NOT NULL,"
    "    default_user TEXT NOT NULL,"
    "    source TEXT,"
    "    created_at INTEGER NOT NULL,"
    "    layers TEXT,"
    "    packages TEXT"
    ");";

constexpr const char *kCreateTagsTable =
    "CREATE TABLE IF NOT EXISTS tags ("
    "    reference TEXT PRIMARY KEY,"
    "    image_id TEXT NOT NULL"
    ");";

constexpr const char *kCreateTagsIndex =
    "CREATE INDEX IF NOT EXISTS tags_image_id ON tags (image_id);";

constexpr const char *kSelectImageColumns =
    "SELECT id, parent_id, rootfs, default_user, source, created_at, "
    "layers, packages FROM images";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

// BEGIN IMMEDIATE on construction; rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : db(db)
    {
        execOrThrow(db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (open && sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            SLOG_WARN(QStringLiteral("ImageStore"),
                      QStringLiteral("Transaction"),
                      QStringLiteral("rollback_failed"),
                      QStringLiteral("store_write"),
                      QStringLiteral("sqlite_exec"),
                      stratum::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", sqlite3_errmsg(db)}}));
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execOrThrow(db, "COMMIT;");
        open = false;
    }

private:
    sqlite3 *db;
    bool open = true;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void stepDone(sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(what);
    }
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

bool isHexPrefix(const std::string &value)
{
    return value.size() >= kMinIdPrefixLength
        && std::all_of(value.begin(), value.end(), [](unsigned char c) {
               return std::isxdigit(c) && !std::isupper(c);
           });
}

ImageRecord imageFromRow(sqlite3_stmt *stmt)
{
    ImageRecord image;
    image.id = columnText(stmt, 0);
    image.parentId = columnText(stmt, 1);
    image.rootfs = columnText(stmt, 2);
    image.defaultUser = columnText(stmt, 3);
    image.source = columnText(stmt, 4);
    image.createdAt = fromEpochSeconds(sqlite3_column_int64(stmt, 5));

    const nlohmann::json layers = columnJson(stmt, 6);
    if (layers.is_array()) {
        image.layers = layers.get<std::vector<LayerRecord>>();
    }
    const nlohmann::json packages = columnJson(stmt, 7);
    if (packages.is_object()) {
        image.packages = packages.get<std::map<std::string, std::string>>();
    }
    return image;
}

} // namespace

struct ImageStore::Impl {
    sqlite3 *db = nullptr;
    std::filesystem::path stateDir;

    std::vector<std::string> tagsFor(const std::string &imageId) const
    {
        Statement stmt(db,
                       "SELECT reference FROM tags WHERE image_id = ? "
                       "ORDER BY reference ASC;");
        bindText(stmt.get(), 1, imageId);
        std::vector<std::string> tags;
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            tags.push_back(columnText(stmt.get(), 0));
        }
        return tags;
    }

    void insertTag(const std::string &normalized, const std::string &imageId)
    {
        Statement stmt(db,
                       "INSERT OR REPLACE INTO tags (reference, image_id) VALUES (?, ?);");
        bindText(stmt.get(), 1, normalized);
        bindText(stmt.get(), 2, imageId);
        stepDone(stmt.get(), "failed to tag image");
    }

    std::optional<std::string> imageIdForTag(const std::string &reference) const
    {
        Statement stmt(db, "SELECT image_id FROM tags WHERE reference = ?;");
        bindText(stmt.get(), 1, reference);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            return columnText(stmt.get(), 0);
        }
        return std::nullopt;
    }
};

ImageStore::ImageStore(const std::filesystem::path &stateDir)
    : impl(std::make_unique<Impl>())
{
    impl->stateDir = stateDir;
    std::filesystem::create_directories(stateDir / "images");

    const std::filesystem::path dbPath = stateDir / "images.db";
    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        // sqlite3_open allocates a handle even on failure.
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open image database " + dbPath.string());
    }

    if (sqlite3_busy_timeout(impl->db, kBusyTimeoutMs) != SQLITE_OK) {
        throw std::runtime_error(std::string("failed to configure image database: ")
                                 + sqlite3_errmsg(impl->db));
    }
    execOrThrow(impl->db, kCreateImagesTable);
    execOrThrow(impl->db, kCreateTagsTable);
    execOrThrow(impl->db, kCreateTagsIndex);
}

ImageStore::~ImageStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

const std::filesystem::path &ImageStore::stateDir() const
{
    return impl->stateDir;
}

std::filesystem::path ImageStore::imageDir(const std::string &id) const
{
    return impl->stateDir / "images" / id;
}

void ImageStore::addImage(const ImageRecord &image, const std::vector<std::string> &tags)
{
    for (const auto &tag : tags) {
        if (!isValidImageReference(tag)) {
            throw std::runtime_error("invalid image reference '" + tag + "'");
        }
    }

    Transaction transaction(impl->db);
    {
        Statement stmt(impl->db,
                       "INSERT INTO images (id, parent_id, rootfs, default_user, "
                       "source, created_at, layers, packages) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, image.id);
        bindOptionalText(stmt.get(), 2, image.parentId);
        bindText(stmt.get(), 3, image.rootfs);
        bindText(stmt.get(), 4, image.defaultUser);
        bindOptionalText(stmt.get(), 5, image.source);
        sqlite3_bind_int64(stmt.get(), 6, toEpochSeconds(image.createdAt));
        bindText(stmt.get(), 7, nlohmann::json(image.layers).dump());
        bindText(stmt.get(), 8, nlohmann::json(image.packages).dump());
        stepDone(stmt.get(), "failed to insert image");
    }
    for (const auto &tag : tags) {
        impl->insertTag(normalizeImageReference(tag), image.id);
    }
    transaction.commit();

    SLOG_INFO(QStringLiteral("ImageStore"),
              QStringLiteral("addImage"),
              QStringLiteral("image_recorded"),
              QStringLiteral("image_commit"),
              QStringLiteral("sqlite_insert"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"id", image.id},
                              {"parent", image.parentId},
                              {"layers", image.layers.size()},
                              {"packages", image.packages.size()},
                              {"tags", tags}}));
}

void ImageStore::tagImage(const std::string &reference, const std::string &imageId)
{
    if (!isValidImageReference(reference)) {
        throw std::runtime_error("invalid image reference '" + reference + "'");
    }
    if (!getImage(imageId).has_value()) {
        throw std::runtime_error("no such image: " + imageId);
    }
    impl->insertTag(normalizeImageReference(reference), imageId);
}

std::optional<ImageRecord> ImageStore::findByReference(const std::string &reference) const
{
    if (const auto id = impl->imageIdForTag(normalizeImageReference(reference))) {
        return getImage(*id);
    }

    if (!isHexPrefix(reference)) {
        return std::nullopt;
    }

    Statement stmt(impl->db, "SELECT id FROM images WHERE substr(id, 1, ?) = ? LIMIT 2;");
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(reference.size()));
    bindText(stmt.get(), 2, reference);
    std::vector<std::string> matches;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        matches.push_back(columnText(stmt.get(), 0));
    }
    if (matches.size() != 1) {
        return std::nullopt;
    }
    return getImage(matches.front());
}

std::optional<ImageRecord> ImageStore::getImage(const std::string &id) const
{
    const std::string sql = std::string(kSelectImageColumns) + " WHERE id = ?;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    ImageRecord image = imageFromRow(stmt.get());
    image.tags = impl->tagsFor(image.id);
    return image;
}

std::vector<ImageRecord> ImageStore::listImages() const
{
    const std::string sql = std::string(kSelectImageColumns)
        + " ORDER BY created_at DESC, id ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<ImageRecord> images;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        images.push_back(imageFromRow(stmt.get()));
    }
    for (auto &image : images) {
        image.tags = impl->tagsFor(image.id);
    }
    return images;
}

bool ImageStore::removeTag(const std::string &reference)
{
    const std::string normalized = normalizeImageReference(reference);
    std::string imageId;
    bool byTag = false;
    if (const auto tagged = impl->imageIdForTag(normalized)) {
        imageId = *tagged;
        byTag = true;
    } else if (const auto image = findByReference(reference)) {
        if (!image->tags.empty()) {
            std::string tags;
            for (const auto &tag : image->tags) {
                tags += (tags.empty() ? "" : ", ") + tag;
            }
            throw std::runtime_error("image " + shortId(image->id)
                                     + " is still tagged as " + tags);
        }
        imageId = image->id;
    } else {
        throw std::runtime_error("no such image: " + reference);
    }

    {
        Transaction transaction(impl->db);
        if (byTag) {
            Statement stmt(impl->db, "DELETE FROM tags WHERE reference = ?;");
            bindText(stmt.get(), 1, normalized);
            stepDone(stmt.get(), "failed to remove tag");
        }
        if (!impl->tagsFor(imageId).empty()) {
            transaction.commit();
            return false;
        }
        Statement stmt(impl->db, "DELETE FROM images WHERE id = ?;");
        bindText(stmt.get(), 1, imageId);
        stepDone(stmt.get(), "failed to remove image");
        transaction.commit();
    }

    std::error_code error;
    std::filesystem::remove_all(imageDir(imageId), error);
    if (error) {
        SLOG_WARN(QStringLiteral("ImageStore"),
                  QStringLiteral("removeTag"),
                  QStringLiteral("image_dir_remove_failed"),
                  QStringLiteral("image_removal"),
                  QStringLiteral("remove_all"),
                  stratum::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"id", imageId}, {"error", error.message()}}));
    }
    return true;
}

ImageRecord ImageStore::importImage(const std::string &reference,
                                    const std::filesystem::path &rootfs,
                                    const std::string &defaultUser)
{
    if (!isValidImageReference(reference)) {
        throw std::runtime_error("invalid image reference '" + reference + "'");
    }
    if (!std::filesystem::is_directory(rootfs)) {
        throw std::runtime_error("root filesystem " + rootfs.string()
                                 + " is not a directory");
    }

    ImageRecord image;
    image.id = generateHexId();
    image.rootfs = (imageDir(image.id) / "rootfs").string();
    image.defaultUser = defaultUser.empty() ? "root" : defaultUser;
    image.source = "import:" + std::filesystem::absolute(rootfs).string();
    image.createdAt = std::chrono::system_clock::now();

    std::string error;
    if (!copyTree(rootfs, image.rootfs, &error)) {
        std::error_code cleanupError;
        std::filesystem::remove_all(imageDir(image.id), cleanupError);
        throw std::runtime_error(error);
    }
    image.packages = readPackageInventory(image.rootfs);

    try {
        addImage(image, {reference});
    } catch (const std::exception &) {
        std::error_code cleanupError;
        std::filesystem::remove_all(imageDir(image.id), cleanupError);
        throw;
    }
    image.tags = impl->tagsFor(image.id);
    return image;
}

} // namespace stratum
