#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sessiondb::session {

/// 128-bit session identifier held as two signed 64-bit halves, matching the
/// SESSION_ID1 / SESSION_ID2 key columns. Textual form is the canonical
/// 8-4-4-4-12 lowercase hex UUID string.
/// Class abbreviation: sid
struct SessionId {
  int64_t iHi = 0;
  int64_t iLo = 0;

  /// Random version-4 identifier drawn from OpenSSL RAND_bytes.
  static SessionId generate();

  /// Parse the canonical 36-character form (hex digits are case-insensitive).
  /// Throws InvalidSessionIdError on any other input.
  static SessionId parse(std::string_view svText);

  std::string toString() const;

  bool operator==(const SessionId&) const = default;
};

}  // namespace sessiondb::session

template <>
struct std::hash<sessiondb::session::SessionId> {
  size_t operator()(const sessiondb::session::SessionId& sid) const noexcept {
    const auto uHi = static_cast<uint64_t>(sid.iHi);
    const auto uLo = static_cast<uint64_t>(sid.iLo);
    return std::hash<uint64_t>{}(uHi ^ (uLo + 0x9e3779b97f4a7c15ULL + (uHi << 6) + (uHi >> 2)));
  }
};
