#include "session/AttributeCodec.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <cstddef>

using sessiondb::common::Bytes;
using sessiondb::common::SerializationError;
using sessiondb::session::CborAttributeCodec;

TEST(AttributeCodecTest, StructuredValueSurvivesEncoding) {
  CborAttributeCodec acCodec;
  const nlohmann::json jValue = {
      {"user", "alice"},
      {"roles", {"admin", "viewer"}},
      {"visits", 12},
      {"ratio", 0.25},
      {"active", true},
  };
  EXPECT_EQ(acCodec.deserialize(acCodec.serialize(jValue)), jValue);
}

TEST(AttributeCodecTest, EncodesStringAsCborTextString) {
  CborAttributeCodec acCodec;
  const Bytes vBytes = acCodec.serialize("bar");
  // major type 3 (text string), length 3, then the UTF-8 bytes
  ASSERT_EQ(vBytes.size(), 4u);
  EXPECT_EQ(vBytes[0], std::byte{0x63});
  EXPECT_EQ(vBytes[1], std::byte{'b'});
}

TEST(AttributeCodecTest, BinaryPayloadSurvivesEncoding) {
  CborAttributeCodec acCodec;
  const auto jBinary = nlohmann::json::binary({0x00, 0xff, 0x10});
  EXPECT_EQ(acCodec.deserialize(acCodec.serialize(jBinary)), jBinary);
}

TEST(AttributeCodecTest, TruncatedInputThrowsSerializationError) {
  CborAttributeCodec acCodec;
  Bytes vBytes = acCodec.serialize("a longer string value");
  vBytes.resize(vBytes.size() - 3);
  EXPECT_THROW(acCodec.deserialize(vBytes), SerializationError);
}

TEST(AttributeCodecTest, EmptyInputThrowsSerializationError) {
  CborAttributeCodec acCodec;
  EXPECT_THROW(acCodec.deserialize(Bytes{}), SerializationError);
}
