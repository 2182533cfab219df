#include "json.hpp"

namespace squirrel {
namespace http {

nlohmann::json encode_record(const store::Record &record) {
    return {{"id", record.id}, {"name", record.name}, {"size", record.size}};
}

nlohmann::json encode_records(const std::vector<store::Record> &records) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &record : records) {
        result.push_back(encode_record(record));
    }
    return result;
}

}  // namespace http
}  // namespace squirrel
