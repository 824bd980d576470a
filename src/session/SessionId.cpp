#include "session/SessionId.hpp"

#include "common/Errors.hpp"

#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace sessiondb::session {

namespace {
constexpr size_t kTextLen = 36;
constexpr std::array<size_t, 4> kDashPositions = {8, 13, 18, 23};
constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isDashPosition(size_t nPos) {
  for (size_t nDash : kDashPositions) {
    if (nPos == nDash) return true;
  }
  return false;
}

void appendHex(std::string& sOut, uint64_t uValue, int iDigits) {
  for (int i = iDigits - 1; i >= 0; --i) {
    sOut.push_back(kHexDigits[(uValue >> (i * 4)) & 0xF]);
  }
}
}  // namespace

SessionId SessionId::generate() {
  std::array<unsigned char, 16> vBytes{};
  if (RAND_bytes(vBytes.data(), static_cast<int>(vBytes.size())) != 1) {
    throw std::runtime_error("Failed to generate random bytes for session id");
  }

  // RFC 4122 version 4, IETF variant
  vBytes[6] = static_cast<unsigned char>((vBytes[6] & 0x0F) | 0x40);
  vBytes[8] = static_cast<unsigned char>((vBytes[8] & 0x3F) | 0x80);

  uint64_t uHi = 0;
  uint64_t uLo = 0;
  for (size_t i = 0; i < 8; ++i) {
    uHi = (uHi << 8) | vBytes[i];
    uLo = (uLo << 8) | vBytes[i + 8];
  }
  return SessionId{static_cast<int64_t>(uHi), static_cast<int64_t>(uLo)};
}

SessionId SessionId::parse(std::string_view svText) {
  if (svText.size() != kTextLen) {
    throw common::InvalidSessionIdError(
        "invalid_session_id",
        "Invalid session id '" + std::string(svText) + "': expected 36 characters");
  }

  uint64_t uHi = 0;
  uint64_t uLo = 0;
  int iNibbles = 0;
  for (size_t i = 0; i < svText.size(); ++i) {
    if (isDashPosition(i)) {
      if (svText[i] != '-') {
        throw common::InvalidSessionIdError(
            "invalid_session_id",
            "Invalid session id '" + std::string(svText) + "': expected '-' at position " +
                std::to_string(i));
      }
      continue;
    }
    const int iValue = hexValue(svText[i]);
    if (iValue < 0) {
      throw common::InvalidSessionIdError(
          "invalid_session_id",
          "Invalid session id '" + std::string(svText) + "': non-hex character at position " +
              std::to_string(i));
    }
    if (iNibbles < 16) {
      uHi = (uHi << 4) | static_cast<uint64_t>(iValue);
    } else {
      uLo = (uLo << 4) | static_cast<uint64_t>(iValue);
    }
    ++iNibbles;
  }
  return SessionId{static_cast<int64_t>(uHi), static_cast<int64_t>(uLo)};
}

std::string SessionId::toString() const {
  const auto uHi = static_cast<uint64_t>(iHi);
  const auto uLo = static_cast<uint64_t>(iLo);

  std::string sOut;
  sOut.reserve(kTextLen);
  appendHex(sOut, uHi >> 32, 8);
  sOut.push_back('-');
  appendHex(sOut, (uHi >> 16) & 0xFFFF, 4);
  sOut.push_back('-');
  appendHex(sOut, uHi & 0xFFFF, 4);
  sOut.push_back('-');
  appendHex(sOut, uLo >> 48, 4);
  sOut.push_back('-');
  appendHex(sOut, uLo & 0xFFFFFFFFFFFFULL, 12);
  return sOut;
}

}  // namespace sessiondb::session
