#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "store/record.hpp"

namespace squirrel {
namespace http {

/**
 * @brief JSON encoding for squirrel records
 *
 * A record is {"id": <int>, "name": <string>, "size": <string>}; the index
 * is a bare array of records in the order given.
 */
nlohmann::json encode_record(const store::Record &record);
nlohmann::json encode_records(const std::vector<store::Record> &records);

}  // namespace http
}  // namespace squirrel
