#pragma once

#include <string>
#include "zktable/table.pb.h"
#include "errors.hpp"

namespace zktable {

/**
 * Decode a table node payload.
 *
 * @param payload Non-empty serialized Table message
 * @return The recorded state
 * @throws DecodeError if the payload is not a complete, valid Table
 */
Table::State decode_table_state(const std::string& payload);

/**
 * Encode a state the way the master writes it into a table node.
 */
std::string encode_table_state(Table::State state);

/**
 * Name of a state as it appears in the protocol ("DISABLED", ...).
 */
inline std::string state_name(Table::State state) {
    return Table::State_Name(state);
}

} // namespace zktable
