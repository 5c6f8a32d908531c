//===----------------------------------------------------------------------===//
//                         PeerSync
//
// importer/conflict_strategy.hpp
//
// How an imported row interacts with an existing row sharing its key
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace peersync {

enum class ConflictStrategy : uint8_t {
    SKIP = 0,       // keep the existing row
    OVERWRITE = 1,  // replace existing columns with incoming values
    MERGE = 2,      // incoming non-null values win, nulls keep existing
    APPEND = 3      // always insert under a freshly generated key
};

const char* ConflictStrategyToString(ConflictStrategy strategy);
bool ParseConflictStrategy(const std::string& text, ConflictStrategy& out);

enum class WriteAction : uint8_t {
    INSERT,
    INSERT_FRESH_KEY,
    UPDATE,
    SKIP
};

struct ConflictResolution {
    WriteAction action = WriteAction::SKIP;
    // INSERT: full row. INSERT_FRESH_KEY: row without key columns.
    // UPDATE: non-key columns to set, possibly none. SKIP: empty.
    nlohmann::json values = nlohmann::json::object();
};

// Single decision point for one incoming record. `exists` tells whether a
// local row shares the record's primary key. No I/O.
ConflictResolution ResolveConflict(ConflictStrategy strategy,
                                   bool exists,
                                   const nlohmann::json& incoming,
                                   const std::vector<std::string>& primary_key);

} // namespace peersync
