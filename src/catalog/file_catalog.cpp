#include "cidboost/catalog/file_catalog.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include <algorithm>
#include <fstream>

namespace cidboost {

void to_json(nlohmann::json& j, const FileRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"cid", record.cid},
        {"name", record.name},
        {"size", record.size},
        {"mime_type", record.mime_type},
        {"encryption_type", record.encryption_type},
        {"encryption_meta", record.encryption_meta},
        {"saved_path", record.saved_path}
    };
}

void from_json(const nlohmann::json& j, FileRecord& record) {
    j.at("id").get_to(record.id);
    j.at("cid").get_to(record.cid);
    record.name = j.value("name", "");
    record.size = j.value("size", uint64_t{0});
    record.mime_type = j.value("mime_type", "");
    record.encryption_type = j.value("encryption_type", "");
    record.encryption_meta = j.value("encryption_meta", "");
    record.saved_path = j.value("saved_path", "");
}

JsonFileCatalog::JsonFileCatalog(std::filesystem::path path)
    : path_(std::move(path)) {
}

void JsonFileCatalog::load() {
    std::ifstream in(path_);
    if (!in) {
        Logger::instance().info("Catalog {} not found, starting empty", path_.string());
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
        return;
    }

    std::vector<FileRecord> loaded;
    try {
        auto j = nlohmann::json::parse(in);
        loaded = j.get<std::vector<FileRecord>>();
    } catch (const nlohmann::json::exception& e) {
        throw CidBoostError(ErrorCode::InvalidArgument,
                            "malformed catalog " + path_.string() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(loaded);
    Logger::instance().info("Loaded {} file records from {}", records_.size(), path_.string());
}

bool JsonFileCatalog::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

bool JsonFileCatalog::save_locked() const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            Logger::instance().error("Cannot write catalog {}", tmp.string());
            return false;
        }
        out << nlohmann::json(records_).dump(2);
        if (!out.good()) {
            Logger::instance().error("Failed writing catalog {}", tmp.string());
            return false;
        }
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        Logger::instance().error("Failed to replace catalog {}: {}", path_.string(), ec.message());
        return false;
    }
    return true;
}

void JsonFileCatalog::put(const FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const FileRecord& r) { return r.id == record.id; });
    if (it != records_.end()) {
        *it = record;
    } else {
        records_.push_back(record);
    }
}

std::vector<FileRecord> JsonFileCatalog::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::optional<FileRecord> JsonFileCatalog::find(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.id == id) return record;
    }
    return std::nullopt;
}

std::optional<FileRecord> JsonFileCatalog::find_by_cid(const std::string& cid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.cid == cid) return record;
    }
    return std::nullopt;
}

bool JsonFileCatalog::update_saved_path(uint64_t id, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [id](const FileRecord& r) { return r.id == id; });
    if (it == records_.end()) {
        return false;
    }
    it->saved_path = path;
    return save_locked();
}

} // namespace cidboost
