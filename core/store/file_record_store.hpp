#pragma once

#include <string>

#include "memory_record_store.hpp"

namespace squirrel {
namespace store {

/**
 * @brief Record store persisted as a JSON document
 *
 * File layout:
 *   {"next_id": 4, "squirrels": [{"id": 1, "name": "Chip", "size": "small"}, ...]}
 *
 * The whole collection is held in memory after open(). Every mutation
 * rewrites the document through "<path>.tmp" and a rename, so a failed
 * write leaves the previous file intact. If the write fails the in-memory
 * change is rolled back and the operation reports failure.
 *
 * next_id is persisted so ids are never reused across restarts.
 */
class FileRecordStore : public MemoryRecordStore {
public:
    explicit FileRecordStore(std::string path);

    // Loads the document, or creates an empty one when the file does not exist
    bool open(std::string &error) override;

    bool insert(const std::string &name, const std::string &size, Record &created) override;
    bool update(RecordId id, const std::string &name, const std::string &size) override;
    bool remove(RecordId id) override;

    const std::string &path() const { return path_; }

private:
    bool load(std::string &error);
    bool save(std::string &error) const;

    std::string path_;
    bool opened_ = false;
};

}  // namespace store
}  // namespace squirrel
