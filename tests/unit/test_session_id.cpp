#include "session/SessionId.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

using sessiondb::common::InvalidSessionIdError;
using sessiondb::session::SessionId;

TEST(SessionIdTest, FormatsCanonicalLowercaseText) {
  SessionId sid{static_cast<int64_t>(0x0123456789abcdefULL),
                static_cast<int64_t>(0xfedcba9876543210ULL)};
  EXPECT_EQ(sid.toString(), "01234567-89ab-cdef-fedc-ba9876543210");
}

TEST(SessionIdTest, ParsesIntoSignedHalves) {
  auto sid = SessionId::parse("ffffffff-ffff-ffff-8000-000000000001");
  EXPECT_EQ(sid.iHi, -1);
  EXPECT_EQ(sid.iLo, static_cast<int64_t>(0x8000000000000001ULL));
}

TEST(SessionIdTest, ParseAcceptsUppercaseHex) {
  auto sid = SessionId::parse("01234567-89AB-CDEF-FEDC-BA9876543210");
  EXPECT_EQ(sid.toString(), "01234567-89ab-cdef-fedc-ba9876543210");
}

TEST(SessionIdTest, TextRoundTripIsStable) {
  const std::string sText = "3f2504e0-4f89-41d3-9a0c-0305e82c3301";
  EXPECT_EQ(SessionId::parse(sText).toString(), sText);
}

TEST(SessionIdTest, GeneratedIdsAreVersion4AndDistinct) {
  std::unordered_set<SessionId> stSeen;
  for (int i = 0; i < 100; ++i) {
    auto sid = SessionId::generate();
    const std::string sText = sid.toString();
    EXPECT_EQ(sText[14], '4');
    EXPECT_NE(std::string("89ab").find(sText[19]), std::string::npos);
    EXPECT_EQ(SessionId::parse(sText), sid);
    stSeen.insert(sid);
  }
  EXPECT_EQ(stSeen.size(), 100u);
}

TEST(SessionIdTest, RejectsWrongLength) {
  EXPECT_THROW(SessionId::parse(""), InvalidSessionIdError);
  EXPECT_THROW(SessionId::parse("1-2-3-4-5"), InvalidSessionIdError);
  EXPECT_THROW(SessionId::parse("3f2504e0-4f89-41d3-9a0c-0305e82c33011"),
               InvalidSessionIdError);
}

TEST(SessionIdTest, RejectsMisplacedDashes) {
  EXPECT_THROW(SessionId::parse("3f2504e04-f89-41d3-9a0c-0305e82c3301"),
               InvalidSessionIdError);
}

TEST(SessionIdTest, RejectsNonHexCharacters) {
  EXPECT_THROW(SessionId::parse("3f2504e0-4f89-41d3-9a0c-0305e82c330g"),
               InvalidSessionIdError);
}

TEST(SessionIdTest, EqualityComparesBothHalves) {
  SessionId a{1, 2};
  SessionId b{1, 2};
  SessionId c{1, 3};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}
