#include "dal/SessionRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SessionRowAssembler.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace sessiondb::dal {

namespace {

// Keeps one batched INSERT well under the 65535 bind parameter limit
constexpr size_t kAttributeBatchRows = 500;

SessionRow toSessionRow(const pqxx::row& row) {
  SessionRow srRow;
  srRow.iId1 = row[0].as<int64_t>();
  srRow.iId2 = row[1].as<int64_t>();
  srRow.iCreationTime = row[2].as<int64_t>();
  srRow.iLastAccessTime = row[3].as<int64_t>();
  srRow.iMaxInactiveInterval = row[4].as<int>();
  if (!row[5].is_null()) {
    srRow.oAttributeName = row[5].as<std::string>();
    srRow.vAttributeBytes = row[6].as<common::Bytes>();
  }
  return srRow;
}

}  // namespace

SessionRepository::SessionRepository(ConnectionPool& cpPool,
                                     std::shared_ptr<const session::IAttributeCodec> spCodec)
    : _cpPool(cpPool),
      _fnPrincipalResolver(session::resolvePrincipalName),
      _fnClock(common::systemNow),
      _sqQueries(SessionQueries::forTable(kDefaultTableName)) {
  setCodec(std::move(spCodec));
}

SessionRepository::~SessionRepository() = default;

// ── Configuration ──────────────────────────────────────────────────────────

void SessionRepository::setTableName(const std::string& sTableName) {
  _sqQueries = SessionQueries::forTable(sTableName);
}

void SessionRepository::setQueries(SessionQueries sqQueries) {
  sqQueries.validate();
  _sqQueries = std::move(sqQueries);
}

void SessionRepository::setDefaultMaxInactiveInterval(
    std::optional<std::chrono::seconds> oInterval) {
  if (oInterval.has_value()) {
    session::requireStorableInterval(*oInterval);
  }
  _oDefaultMaxInactiveInterval = oInterval;
}

void SessionRepository::setCodec(std::shared_ptr<const session::IAttributeCodec> spCodec) {
  if (!spCodec) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Attribute codec must not be null");
  }
  _spCodec = std::move(spCodec);
}

void SessionRepository::setPrincipalNameResolver(session::PrincipalNameResolver fnResolver) {
  if (!fnResolver) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Principal name resolver must not be empty");
  }
  _fnPrincipalResolver = std::move(fnResolver);
}

void SessionRepository::setClock(common::ClockFn fnClock) {
  if (!fnClock) {
    throw common::ConfigurationError("invalid_configuration", "Clock must not be empty");
  }
  _fnClock = std::move(fnClock);
}

// ── Operations ─────────────────────────────────────────────────────────────

session::Session SessionRepository::createSession() const {
  session::Session ssSession(_fnClock());
  if (_oDefaultMaxInactiveInterval.has_value()) {
    ssSession.setMaxInactiveInterval(*_oDefaultMaxInactiveInterval);
  }
  return ssSession;
}

void SessionRepository::save(session::Session& ssSession) {
  {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    if (ssSession.isNew()) {
      insertSession(txn, ssSession);
      insertAttributes(txn, ssSession);
    } else {
      if (ssSession.isChanged()) {
        updateSession(txn, ssSession);
      }
      applyDelta(txn, ssSession);
    }
    txn.commit();
  }

  common::Logger::get()->debug("Saved session {} (new={}, changed={}, delta={})",
                               ssSession.getId(), ssSession.isNew(), ssSession.isChanged(),
                               ssSession.delta().size());
  ssSession.clearChangeFlags();
}

std::optional<session::Session> SessionRepository::findById(const std::string& sId) {
  const auto sid = session::SessionId::parse(sId);

  std::vector<session::Session> vSessions;
  {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(_sqQueries.sGetSession, pqxx::params{sid.iHi, sid.iLo});
    txn.commit();
    vSessions = assemble(result);
  }

  if (vSessions.empty()) {
    return std::nullopt;
  }

  if (vSessions.front().isExpired(_fnClock())) {
    common::Logger::get()->debug("Session {} expired on lookup, deleting", sId);
    deleteById(sid);
    return std::nullopt;
  }
  return std::move(vSessions.front());
}

void SessionRepository::deleteById(const std::string& sId) {
  deleteById(session::SessionId::parse(sId));
}

void SessionRepository::deleteById(const session::SessionId& sid) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(_sqQueries.sDeleteSession, pqxx::params{sid.iHi, sid.iLo});
  txn.commit();
  common::Logger::get()->debug("Deleted session {} ({} rows)", sid.toString(),
                               result.affected_rows());
}

std::unordered_map<std::string, session::Session>
SessionRepository::findByIndexNameAndIndexValue(const std::string& sIndexName,
                                                const std::string& sIndexValue) {
  std::unordered_map<std::string, session::Session> mSessions;
  if (sIndexName != session::kPrincipalNameIndexName) {
    return mSessions;
  }

  std::vector<session::Session> vSessions;
  {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result =
        txn.exec(_sqQueries.sListSessionsByPrincipalName, pqxx::params{sIndexValue});
    txn.commit();
    vSessions = assemble(result);
  }

  mSessions.reserve(vSessions.size());
  for (auto& ssSession : vSessions) {
    std::string sId = ssSession.getId();
    mSessions.insert_or_assign(std::move(sId), std::move(ssSession));
  }
  return mSessions;
}

int SessionRepository::cleanUpExpiredSessions() {
  const int64_t iNow = common::toEpochMillis(_fnClock());

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(_sqQueries.sDeleteSessionsByExpiryTime, pqxx::params{iNow});
  txn.commit();

  const int iDeleted = static_cast<int>(result.affected_rows());
  common::Logger::get()->debug("Cleaned up {} expired sessions", iDeleted);
  return iDeleted;
}

std::optional<std::string> SessionRepository::principalNameOf(
    const session::Session& ssSession) const {
  return _fnPrincipalResolver(ssSession);
}

// ── Statement helpers ──────────────────────────────────────────────────────

void SessionRepository::insertSession(pqxx::work& txn, const session::Session& ssSession) {
  const auto& sid = ssSession.sessionId();
  txn.exec(_sqQueries.sCreateSession,
           pqxx::params{sid.iHi, sid.iLo,
                        common::toEpochMillis(ssSession.getCreationTime()),
                        common::toEpochMillis(ssSession.getLastAccessedTime()),
                        static_cast<int>(ssSession.getMaxInactiveInterval().count()),
                        expiryMillis(ssSession), principalNameOf(ssSession)});
}

void SessionRepository::insertAttributes(pqxx::work& txn, const session::Session& ssSession) {
  const auto& mAttributes = ssSession.attributes();
  if (mAttributes.empty()) {
    return;
  }

  const auto& sid = ssSession.sessionId();
  std::vector<std::pair<std::string, common::Bytes>> vRows;
  vRows.reserve(mAttributes.size());
  for (const auto& [sName, jValue] : mAttributes) {
    vRows.emplace_back(sName, _spCodec->serialize(jValue));
  }

  for (size_t nBegin = 0; nBegin < vRows.size(); nBegin += kAttributeBatchRows) {
    const size_t nEnd = std::min(vRows.size(), nBegin + kAttributeBatchRows);
    const auto oBatchSql =
        _sqQueries.createSessionAttributeBatch(static_cast<int>(nEnd - nBegin));

    if (oBatchSql.has_value()) {
      pqxx::params prm;
      for (size_t i = nBegin; i < nEnd; ++i) {
        prm.append(sid.iHi);
        prm.append(sid.iLo);
        prm.append(vRows[i].first);
        prm.append(vRows[i].second);
      }
      txn.exec(*oBatchSql, prm);
    } else {
      for (size_t i = nBegin; i < nEnd; ++i) {
        txn.exec(_sqQueries.sCreateSessionAttribute,
                 pqxx::params{sid.iHi, sid.iLo, vRows[i].first, vRows[i].second});
      }
    }
  }
}

void SessionRepository::updateSession(pqxx::work& txn, const session::Session& ssSession) {
  const auto& sid = ssSession.sessionId();
  // Rows are still keyed by the stored id when the id was rotated
  const auto& sidStored = ssSession.previousId().value_or(sid);
  txn.exec(_sqQueries.sUpdateSession,
           pqxx::params{sid.iHi, sid.iLo,
                        common::toEpochMillis(ssSession.getLastAccessedTime()),
                        static_cast<int>(ssSession.getMaxInactiveInterval().count()),
                        expiryMillis(ssSession), principalNameOf(ssSession),
                        sidStored.iHi, sidStored.iLo});
}

void SessionRepository::applyDelta(pqxx::work& txn, const session::Session& ssSession) {
  const auto& sid = ssSession.sessionId();
  for (const auto& [sName, oValue] : ssSession.delta()) {
    if (!oValue.has_value()) {
      txn.exec(_sqQueries.sDeleteSessionAttribute, pqxx::params{sid.iHi, sid.iLo, sName});
      continue;
    }

    const common::Bytes vBytes = _spCodec->serialize(*oValue);
    auto result = txn.exec(_sqQueries.sUpdateSessionAttribute,
                           pqxx::params{vBytes, sid.iHi, sid.iLo, sName});
    if (result.affected_rows() == 0) {
      txn.exec(_sqQueries.sCreateSessionAttribute,
               pqxx::params{sid.iHi, sid.iLo, sName, vBytes});
    }
  }
}

std::vector<session::Session> SessionRepository::assemble(const pqxx::result& result) const {
  SessionRowAssembler sraAssembler(*_spCodec);
  for (const auto& row : result) {
    sraAssembler.accept(toSessionRow(row));
  }
  return sraAssembler.take();
}

int64_t SessionRepository::expiryMillis(const session::Session& ssSession) const {
  if (ssSession.neverExpires()) {
    return std::numeric_limits<int64_t>::max();
  }
  return common::toEpochMillis(ssSession.getExpiryTime());
}

}  // namespace sessiondb::dal
