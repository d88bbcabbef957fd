#ifndef CIDBOOST_CATALOG_FILE_CATALOG_H
#define CIDBOOST_CATALOG_FILE_CATALOG_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cidboost {

// Stored metadata of an uploaded file
struct FileRecord {
    uint64_t id = 0;
    std::string cid;
    std::string name;
    uint64_t size = 0;
    std::string mime_type;
    std::string encryption_type;   // "", "password" or "private"
    std::string encryption_meta;
    std::string saved_path;        // where the last completed download landed
};

void to_json(nlohmann::json& j, const FileRecord& record);
void from_json(const nlohmann::json& j, FileRecord& record);

class FileCatalog {
public:
    virtual ~FileCatalog() = default;

    virtual std::optional<FileRecord> find(uint64_t id) const = 0;
    virtual std::optional<FileRecord> find_by_cid(const std::string& cid) const = 0;
    // Returns false when the record does not exist or could not be persisted
    virtual bool update_saved_path(uint64_t id, const std::string& path) = 0;
};

// Catalog persisted as a JSON array of records
class JsonFileCatalog : public FileCatalog {
public:
    explicit JsonFileCatalog(std::filesystem::path path);

    // A missing file is an empty catalog. Throws CidBoostError(InvalidArgument)
    // on malformed content.
    void load();
    bool save() const;

    // Inserts or replaces by id
    void put(const FileRecord& record);
    std::vector<FileRecord> records() const;

    std::optional<FileRecord> find(uint64_t id) const override;
    std::optional<FileRecord> find_by_cid(const std::string& cid) const override;
    bool update_saved_path(uint64_t id, const std::string& path) override;

private:
    bool save_locked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::vector<FileRecord> records_;
};

} // namespace cidboost

#endif // CIDBOOST_CATALOG_FILE_CATALOG_H
