#include "file_record_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <utility>

#include "logging/logger.hpp"

namespace squirrel {
namespace store {

namespace fs = std::filesystem;

namespace {

// Restores the in-memory collection unless commit() is called
class Snapshot {
public:
    Snapshot(std::map<RecordId, Record> &records, RecordId &next_id)
        : records_(records), next_id_(next_id), saved_records_(records), saved_next_id_(next_id) {}

    ~Snapshot() {
        if (!committed_) {
            records_ = std::move(saved_records_);
            next_id_ = saved_next_id_;
        }
    }

    void commit() { committed_ = true; }

private:
    std::map<RecordId, Record> &records_;
    RecordId &next_id_;
    std::map<RecordId, Record> saved_records_;
    RecordId saved_next_id_;
    bool committed_ = false;
};

}  // namespace

FileRecordStore::FileRecordStore(std::string path) : path_(std::move(path)) {}

bool FileRecordStore::open(std::string &error) {
    if (path_.empty()) {
        error = "Store path is empty";
        return false;
    }

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        const fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                error = "Cannot create store directory '" + parent.string() + "': " + ec.message();
                return false;
            }
        }

        records_.clear();
        next_id_ = 1;
        if (!save(error)) {
            return false;
        }
        LOG_INFO("[Store] Created " << path_);
    } else if (!load(error)) {
        return false;
    }

    opened_ = true;
    last_error_.clear();
    LOG_INFO("[Store] Opened " << path_ << " (" << records_.size() << " record(s), next id " << next_id_ << ")");
    return true;
}

bool FileRecordStore::insert(const std::string &name, const std::string &size, Record &created) {
    if (!opened_) {
        last_error_ = "Store not opened";
        return false;
    }

    Snapshot snapshot(records_, next_id_);
    Record record;
    if (!MemoryRecordStore::insert(name, size, record)) {
        return false;
    }

    std::string error;
    if (!save(error)) {
        last_error_ = error;
        return false;
    }

    snapshot.commit();
    created = record;
    return true;
}

bool FileRecordStore::update(RecordId id, const std::string &name, const std::string &size) {
    if (!opened_) {
        last_error_ = "Store not opened";
        return false;
    }

    Snapshot snapshot(records_, next_id_);
    if (!MemoryRecordStore::update(id, name, size)) {
        return false;
    }

    std::string error;
    if (!save(error)) {
        last_error_ = error;
        return false;
    }

    snapshot.commit();
    return true;
}

bool FileRecordStore::remove(RecordId id) {
    if (!opened_) {
        last_error_ = "Store not opened";
        return false;
    }

    Snapshot snapshot(records_, next_id_);
    if (!MemoryRecordStore::remove(id)) {
        return false;
    }

    std::string error;
    if (!save(error)) {
        last_error_ = error;
        return false;
    }

    snapshot.commit();
    return true;
}

bool FileRecordStore::load(std::string &error) {
    std::ifstream in(path_);
    if (!in) {
        error = "Cannot open store file: " + path_;
        return false;
    }

    try {
        nlohmann::json doc = nlohmann::json::parse(in);
        if (!doc.is_object() || !doc.contains("squirrels") || !doc["squirrels"].is_array()) {
            error = "Store file '" + path_ + "' is missing the 'squirrels' array";
            return false;
        }

        std::map<RecordId, Record> records;
        RecordId max_id = 0;
        for (const auto &item : doc["squirrels"]) {
            Record record;
            record.id = item.at("id").get<RecordId>();
            record.name = item.at("name").get<std::string>();
            record.size = item.at("size").get<std::string>();

            if (record.id <= 0) {
                error = "Store file '" + path_ + "' contains invalid id " + std::to_string(record.id);
                return false;
            }
            if (!records.emplace(record.id, record).second) {
                error = "Store file '" + path_ + "' contains duplicate id " + std::to_string(record.id);
                return false;
            }
            if (record.id > max_id) {
                max_id = record.id;
            }
        }

        RecordId next_id = doc.value("next_id", max_id + 1);
        if (next_id <= max_id) {
            LOG_WARN("[Store] next_id " << next_id << " in " << path_ << " is not above max id " << max_id
                                        << "; using " << (max_id + 1));
            next_id = max_id + 1;
        }

        records_ = std::move(records);
        next_id_ = next_id;
        return true;
    } catch (const nlohmann::json::exception &e) {
        error = "Store file '" + path_ + "' is corrupt: " + e.what();
        return false;
    }
}

bool FileRecordStore::save(std::string &error) const {
    nlohmann::json squirrels = nlohmann::json::array();
    for (const auto &[id, record] : records_) {
        squirrels.push_back({{"id", record.id}, {"name", record.name}, {"size", record.size}});
    }
    nlohmann::json doc = {{"next_id", next_id_}, {"squirrels", squirrels}};

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Cannot serialize store: ") + e.what();
        return false;
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            error = "Cannot write store file: " + tmp_path;
            return false;
        }
        out << text << "\n";
        out.flush();
        if (!out) {
            error = "Write failed for store file: " + tmp_path;
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        error = "Cannot replace store file '" + path_ + "': " + ec.message();
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

}  // namespace store
}  // namespace squirrel
