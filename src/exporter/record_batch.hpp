//===----------------------------------------------------------------------===//
//                         PeerSync
//
// exporter/record_batch.hpp
//
// One page of exported rows plus pagination metadata
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>

namespace peersync {

struct RecordBatch {
    nlohmann::json records = nlohmann::json::array();  // row objects
    int64_t offset = 0;
    bool has_more = false;

    size_t Size() const { return records.size(); }

    nlohmann::json ToJson() const {
        return {{"records", records}, {"offset", offset}, {"has_more", has_more}};
    }

    static RecordBatch FromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("records") || !j["records"].is_array()) {
            throw std::runtime_error("Malformed record batch");
        }
        RecordBatch batch;
        batch.records = j["records"];
        if (j.contains("offset") && j["offset"].is_number_integer()) {
            batch.offset = j["offset"].get<int64_t>();
        }
        if (j.contains("has_more") && j["has_more"].is_boolean()) {
            batch.has_more = j["has_more"].get<bool>();
        }
        return batch;
    }
};

} // namespace peersync
