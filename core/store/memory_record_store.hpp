#pragma once

#include <map>

#include "i_record_store.hpp"

namespace squirrel {
namespace store {

// Volatile store; contents are lost when the process exits.
class MemoryRecordStore : public IRecordStore {
public:
    MemoryRecordStore() = default;

    bool open(std::string &error) override;

    std::vector<Record> list() const override;
    std::optional<Record> get(RecordId id) const override;
    size_t size() const override { return records_.size(); }

    bool insert(const std::string &name, const std::string &size, Record &created) override;
    bool update(RecordId id, const std::string &name, const std::string &size) override;
    bool remove(RecordId id) override;

    const std::string &last_error() const override { return last_error_; }

protected:
    // Ordered by id so list() needs no sort
    std::map<RecordId, Record> records_;
    RecordId next_id_ = 1;
    std::string last_error_;
};

}  // namespace store
}  // namespace squirrel
