#include "memory_record_store.hpp"

namespace squirrel {
namespace store {

bool MemoryRecordStore::open(std::string &error) {
    (void)error;
    last_error_.clear();
    return true;
}

std::vector<Record> MemoryRecordStore::list() const {
    std::vector<Record> result;
    result.reserve(records_.size());
    for (const auto &[id, record] : records_) {
        result.push_back(record);
    }
    return result;
}

std::optional<Record> MemoryRecordStore::get(RecordId id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryRecordStore::insert(const std::string &name, const std::string &size, Record &created) {
    if (name.empty() || size.empty()) {
        last_error_ = "name and size must be non-empty";
        return false;
    }

    Record record;
    record.id = next_id_++;
    record.name = name;
    record.size = size;
    records_[record.id] = record;

    created = record;
    last_error_.clear();
    return true;
}

bool MemoryRecordStore::update(RecordId id, const std::string &name, const std::string &size) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        last_error_ = "Record not found: " + std::to_string(id);
        return false;
    }
    if (name.empty() || size.empty()) {
        last_error_ = "name and size must be non-empty";
        return false;
    }

    it->second.name = name;
    it->second.size = size;
    last_error_.clear();
    return true;
}

bool MemoryRecordStore::remove(RecordId id) {
    if (records_.erase(id) == 0) {
        last_error_ = "Record not found: " + std::to_string(id);
        return false;
    }
    last_error_.clear();
    return true;
}

}  // namespace store
}  // namespace squirrel
