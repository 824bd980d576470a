#include "dal/SessionRowAssembler.hpp"

#include "session/AttributeCodec.hpp"

#include <chrono>
#include <utility>

namespace sessiondb::dal {

SessionRowAssembler::SessionRowAssembler(const session::IAttributeCodec& acCodec)
    : _acCodec(acCodec) {}

void SessionRowAssembler::accept(const SessionRow& row) {
  const session::SessionId sid{row.iId1, row.iId2};

  if (_vSessions.empty() || _vSessions.back().sessionId() != sid) {
    _vSessions.emplace_back(sid, common::fromEpochMillis(row.iCreationTime),
                            common::fromEpochMillis(row.iLastAccessTime),
                            std::chrono::seconds(row.iMaxInactiveInterval));
  }

  if (row.oAttributeName.has_value()) {
    _vSessions.back().loadAttribute(*row.oAttributeName,
                                    _acCodec.deserialize(row.vAttributeBytes));
  }
}

std::vector<session::Session> SessionRowAssembler::take() {
  return std::exchange(_vSessions, {});
}

}  // namespace sessiondb::dal
