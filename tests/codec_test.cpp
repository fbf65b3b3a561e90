#include <gtest/gtest.h>
#include <string>
#include "zktable/codec.hpp"

using namespace zktable;

// =============================================================================
// Decode Tests
// =============================================================================

TEST(CodecTest, Decode_EncodedDisabled_ShouldReturnDisabled) {
    EXPECT_EQ(decode_table_state(encode_table_state(Table::DISABLED)), Table::DISABLED);
}

TEST(CodecTest, Decode_HandWrittenWireBytes_ShouldReturnState) {
    // field 1, varint 2 => DISABLING
    std::string payload("\x08\x02", 2);
    EXPECT_EQ(decode_table_state(payload), Table::DISABLING);
}

TEST(CodecTest, Decode_EnabledIsWrittenExplicitly_ShouldNotBeEmpty) {
    // proto2 serializes a set field even when it equals the default
    auto payload = encode_table_state(Table::ENABLED);
    EXPECT_FALSE(payload.empty());
    EXPECT_EQ(decode_table_state(payload), Table::ENABLED);
}

TEST(CodecTest, Decode_TruncatedVarint_ShouldThrowDecodeError) {
    std::string payload("\x08\xff", 2);
    try {
        decode_table_state(payload);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.payload_size(), 2u);
        EXPECT_FALSE(e.reason().empty());
    }
}

TEST(CodecTest, Decode_MissingStateField_ShouldThrowDecodeError) {
    // field 2, varint 1: well-formed wire data without the required state
    std::string payload("\x10\x01", 2);
    EXPECT_THROW(decode_table_state(payload), DecodeError);
}

TEST(CodecTest, Decode_OutOfRangeState_ShouldThrowDecodeError) {
    // field 1, varint 7: not one of the four states
    std::string payload("\x08\x07", 2);
    EXPECT_THROW(decode_table_state(payload), DecodeError);
}

TEST(CodecTest, Decode_TextGarbage_ShouldThrowDecodeError) {
    EXPECT_THROW(decode_table_state("not a table record"), DecodeError);
}

// =============================================================================
// Naming Tests
// =============================================================================

TEST(CodecTest, StateName_ShouldMatchProtocolNames) {
    EXPECT_EQ(state_name(Table::ENABLED), "ENABLED");
    EXPECT_EQ(state_name(Table::DISABLED), "DISABLED");
    EXPECT_EQ(state_name(Table::ENABLING), "ENABLING");
    EXPECT_EQ(state_name(Table::DISABLING), "DISABLING");
}
