//===----------------------------------------------------------------------===//
//                         PeerSync
//
// importer/transfer_result.hpp
//
// Per-table import counters and per-record failures
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace peersync {

struct ImportError {
    nlohmann::json record;
    std::string reason;
};

struct TransferResult {
    int64_t created = 0;
    int64_t updated = 0;
    int64_t skipped = 0;
    std::vector<ImportError> errors;

    int64_t Processed() const {
        return created + updated + skipped + static_cast<int64_t>(errors.size());
    }

    void Merge(const TransferResult& other) {
        created += other.created;
        updated += other.updated;
        skipped += other.skipped;
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    }

    std::string Summary() const {
        return "created=" + std::to_string(created) +
               " updated=" + std::to_string(updated) +
               " skipped=" + std::to_string(skipped) +
               " errors=" + std::to_string(errors.size());
    }

    nlohmann::json ToJson() const {
        nlohmann::json errs = nlohmann::json::array();
        for (const auto& error : errors) {
            errs.push_back({{"record", error.record}, {"reason", error.reason}});
        }
        return {{"created", created}, {"updated", updated}, {"skipped", skipped}, {"errors", errs}};
    }
};

} // namespace peersync
