//===----------------------------------------------------------------------===//
//                         PeerSync
//
// sync_exception.hpp
//
// Typed error raised by negotiation, transport and schema failures
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include <stdexcept>
#include <string>

namespace peersync {

class SyncException : public std::runtime_error {
public:
    SyncException(ErrorCode code, const std::string& message, std::string table = "")
        : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + message)
        , code_(code)
        , detail_(message)
        , table_(std::move(table)) {}

    ErrorCode Code() const { return code_; }

    // Message without the error code prefix
    const std::string& Detail() const { return detail_; }

    // Table involved, empty when the error is not table-scoped
    const std::string& Table() const { return table_; }

private:
    ErrorCode code_;
    std::string detail_;
    std::string table_;
};

} // namespace peersync
