//===----------------------------------------------------------------------===//
//                         PeerSync
//
// importer/conflict_strategy.cpp
//
//===----------------------------------------------------------------------===//

#include "importer/conflict_strategy.hpp"
#include <algorithm>
#include <cctype>

namespace peersync {

const char* ConflictStrategyToString(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::SKIP:      return "skip";
        case ConflictStrategy::OVERWRITE: return "overwrite";
        case ConflictStrategy::MERGE:     return "merge";
        case ConflictStrategy::APPEND:    return "append";
    }
    return "unknown";
}

bool ParseConflictStrategy(const std::string& text, ConflictStrategy& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "skip") {
        out = ConflictStrategy::SKIP;
    } else if (lower == "overwrite") {
        out = ConflictStrategy::OVERWRITE;
    } else if (lower == "merge") {
        out = ConflictStrategy::MERGE;
    } else if (lower == "append") {
        out = ConflictStrategy::APPEND;
    } else {
        return false;
    }
    return true;
}

namespace {

bool IsKeyColumn(const std::vector<std::string>& primary_key, const std::string& column) {
    return std::find(primary_key.begin(), primary_key.end(), column) != primary_key.end();
}

nlohmann::json WithoutKey(const nlohmann::json& incoming, const std::vector<std::string>& primary_key) {
    nlohmann::json values = nlohmann::json::object();
    for (auto it = incoming.begin(); it != incoming.end(); ++it) {
        if (!IsKeyColumn(primary_key, it.key())) {
            values[it.key()] = it.value();
        }
    }
    return values;
}

// An existing row under overwrite or merge always counts as updated, even
// when there is nothing left to set
ConflictResolution Update(nlohmann::json values) {
    ConflictResolution resolution;
    resolution.action = WriteAction::UPDATE;
    resolution.values = std::move(values);
    return resolution;
}

} // anonymous namespace

ConflictResolution ResolveConflict(ConflictStrategy strategy,
                                   bool exists,
                                   const nlohmann::json& incoming,
                                   const std::vector<std::string>& primary_key) {
    ConflictResolution resolution;

    if (strategy == ConflictStrategy::APPEND) {
        resolution.action = WriteAction::INSERT_FRESH_KEY;
        resolution.values = WithoutKey(incoming, primary_key);
        return resolution;
    }

    if (!exists) {
        resolution.action = WriteAction::INSERT;
        resolution.values = incoming;
        return resolution;
    }

    switch (strategy) {
        case ConflictStrategy::SKIP:
            resolution.action = WriteAction::SKIP;
            return resolution;

        case ConflictStrategy::OVERWRITE:
            return Update(WithoutKey(incoming, primary_key));

        case ConflictStrategy::MERGE: {
            nlohmann::json values = nlohmann::json::object();
            for (auto it = incoming.begin(); it != incoming.end(); ++it) {
                if (!IsKeyColumn(primary_key, it.key()) && !it.value().is_null()) {
                    values[it.key()] = it.value();
                }
            }
            return Update(std::move(values));
        }

        case ConflictStrategy::APPEND:
            break;
    }
    return resolution;
}

} // namespace peersync
