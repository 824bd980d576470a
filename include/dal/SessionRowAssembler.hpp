#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "session/Session.hpp"

namespace sessiondb::session {
class IAttributeCodec;
}  // namespace sessiondb::session

namespace sessiondb::dal {

/// One row of the session/attribute outer join. Session columns repeat on
/// every attribute row; an attribute-less session yields one row with
/// oAttributeName unset.
struct SessionRow {
  int64_t iId1 = 0;
  int64_t iId2 = 0;
  int64_t iCreationTime = 0;    // epoch millis
  int64_t iLastAccessTime = 0;  // epoch millis
  int iMaxInactiveInterval = 0; // seconds
  std::optional<std::string> oAttributeName;
  common::Bytes vAttributeBytes;
};

/// Rebuilds sessions from join rows in a single forward pass. Rows of one
/// session must be contiguous; a row whose id differs from the session
/// currently being built starts a new session.
/// Class abbreviation: sra
class SessionRowAssembler {
 public:
  explicit SessionRowAssembler(const session::IAttributeCodec& acCodec);

  /// Fold one row into the result. Throws SerializationError when the
  /// attribute bytes cannot be decoded.
  void accept(const SessionRow& row);

  /// Sessions in row order. Leaves the assembler empty.
  std::vector<session::Session> take();

 private:
  const session::IAttributeCodec& _acCodec;
  std::vector<session::Session> _vSessions;
};

}  // namespace sessiondb::dal
