#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "record.hpp"

namespace squirrel {
namespace store {

// Interface for record persistence to enable mocking
//
// Failures are reported through the bool return and last_error(); no
// implementation throws across this boundary.
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    // Lifecycle: prepare the backing resource, creating it if missing
    virtual bool open(std::string &error) = 0;

    // Queries
    virtual std::vector<Record> list() const = 0;  // ascending id
    virtual std::optional<Record> get(RecordId id) const = 0;
    virtual size_t size() const = 0;

    // Mutations
    virtual bool insert(const std::string &name, const std::string &size, Record &created) = 0;
    virtual bool update(RecordId id, const std::string &name, const std::string &size) = 0;
    virtual bool remove(RecordId id) = 0;

    // Status
    virtual const std::string &last_error() const = 0;
};

}  // namespace store
}  // namespace squirrel
