#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <pqxx/pqxx>

#include "common/Types.hpp"
#include "dal/SessionQueries.hpp"
#include "session/AttributeCodec.hpp"
#include "session/PrincipalNameResolver.hpp"
#include "session/Session.hpp"

namespace sessiondb::dal {

class ConnectionPool;

/// Persists sessions in <table> and <table>_ATTRIBUTES, writing only what
/// changed since the last save.
///
/// Every storage operation checks out its own connection and runs in its own
/// pqxx::work, independent of any transaction the caller may hold. A failure
/// aborts the whole operation and the pqxx exception reaches the caller
/// unchanged; nothing is retried.
///
/// Concurrent saves of the same session id are not detected: the metadata
/// row is last-writer-wins and attribute rows may interleave.
/// Class abbreviation: sr
class SessionRepository {
 public:
  /// Throws ConfigurationError when spCodec is null.
  explicit SessionRepository(
      ConnectionPool& cpPool,
      std::shared_ptr<const session::IAttributeCodec> spCodec =
          std::make_shared<session::CborAttributeCodec>());
  ~SessionRepository();

  // ── Configuration ─────────────────────────────────────────────────────
  // Not synchronized: configure before sharing the repository.

  /// Regenerate every statement for a new base table name.
  /// Throws ConfigurationError on an empty name.
  void setTableName(const std::string& sTableName);

  /// Replace the statement set. Throws ConfigurationError on an empty statement.
  void setQueries(SessionQueries sqQueries);
  const SessionQueries& queries() const { return _sqQueries; }

  /// Max inactive interval for sessions returned by createSession().
  /// nullopt restores the built-in 1800 seconds. Throws ConfigurationError
  /// outside the 32-bit range of the stored column.
  void setDefaultMaxInactiveInterval(std::optional<std::chrono::seconds> oInterval);

  void setCodec(std::shared_ptr<const session::IAttributeCodec> spCodec);
  void setPrincipalNameResolver(session::PrincipalNameResolver fnResolver);
  void setClock(common::ClockFn fnClock);

  // ── Operations ────────────────────────────────────────────────────────

  /// New unsaved session stamped with the current clock time.
  session::Session createSession() const;

  /// Insert a new session with all its attributes, or apply the metadata
  /// change and attribute delta of an existing one. Clears the session's
  /// change flags after commit.
  void save(session::Session& ssSession);

  /// Session stored under sId, or nullopt when absent or expired. An expired
  /// session is deleted before returning. Throws InvalidSessionIdError on a
  /// malformed id without touching storage.
  std::optional<session::Session> findById(const std::string& sId);

  /// Delete the session and its attributes. No-op when absent.
  void deleteById(const std::string& sId);

  /// Sessions indexed under sIndexValue, keyed by id. Only the principal-name
  /// index is supported; any other index name yields an empty map.
  std::unordered_map<std::string, session::Session> findByIndexNameAndIndexValue(
      const std::string& sIndexName, const std::string& sIndexValue);

  /// Delete all sessions whose stored expiry time is before now.
  /// Returns rows deleted.
  int cleanUpExpiredSessions();

  /// Principal name that save() would persist for this session.
  std::optional<std::string> principalNameOf(const session::Session& ssSession) const;

 private:
  void insertSession(pqxx::work& txn, const session::Session& ssSession);
  void insertAttributes(pqxx::work& txn, const session::Session& ssSession);
  void updateSession(pqxx::work& txn, const session::Session& ssSession);
  void applyDelta(pqxx::work& txn, const session::Session& ssSession);
  void deleteById(const session::SessionId& sid);
  std::vector<session::Session> assemble(const pqxx::result& result) const;
  int64_t expiryMillis(const session::Session& ssSession) const;

  ConnectionPool& _cpPool;
  std::shared_ptr<const session::IAttributeCodec> _spCodec;
  session::PrincipalNameResolver _fnPrincipalResolver;
  common::ClockFn _fnClock;
  SessionQueries _sqQueries;
  std::optional<std::chrono::seconds> _oDefaultMaxInactiveInterval;
};

}  // namespace sessiondb::dal
