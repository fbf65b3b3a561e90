#include "zktable/codec.hpp"

namespace zktable {

Table::State decode_table_state(const std::string& payload) {
    Table table;
    if (!table.ParsePartialFromString(payload)) {
        throw DecodeError("malformed protobuf wire data", payload.size());
    }
    // proto2 keeps out-of-range enum numbers as unknown fields, so an
    // unrecognized state also ends up here as a missing required field.
    if (!table.IsInitialized()) {
        throw DecodeError("missing required fields: " + table.InitializationErrorString(),
                          payload.size());
    }
    return table.state();
}

std::string encode_table_state(Table::State state) {
    Table table;
    table.set_state(state);
    return table.SerializeAsString();
}

} // namespace zktable
