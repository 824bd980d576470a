#pragma once

#include <optional>
#include <string>

namespace sessiondb::dal {

/// Default base name of the sessions table; attributes live in
/// <name>_ATTRIBUTES.
inline constexpr const char* kDefaultTableName = "SESSION_STORE";

/// Statement texts used by SessionRepository, with positional parameters
/// ($1, $2, ...) in the order the repository binds them.
///
/// Queries reading sessions must return the columns
///   SESSION_ID1, SESSION_ID2, CREATION_TIME, LAST_ACCESS_TIME,
///   MAX_INACTIVE_INTERVAL, ATTRIBUTE_NAME, ATTRIBUTE_BYTES
/// with all rows of one session contiguous.
/// Class abbreviation: sq
struct SessionQueries {
  /// $1 id1, $2 id2, $3 creation, $4 last access, $5 max inactive, $6 expiry, $7 principal
  std::string sCreateSession;
  /// $1 id1, $2 id2, $3 name, $4 bytes (repeated per row by the batch insert)
  std::string sCreateSessionAttribute;
  /// $1 id1, $2 id2
  std::string sGetSession;
  /// $1 id1, $2 id2, $3 last access, $4 max inactive, $5 expiry, $6 principal,
  /// $7 stored id1, $8 stored id2
  std::string sUpdateSession;
  /// $1 bytes, $2 id1, $3 id2, $4 name
  std::string sUpdateSessionAttribute;
  /// $1 id1, $2 id2, $3 name
  std::string sDeleteSessionAttribute;
  /// $1 id1, $2 id2
  std::string sDeleteSession;
  /// $1 principal name
  std::string sListSessionsByPrincipalName;
  /// $1 now (epoch millis)
  std::string sDeleteSessionsByExpiryTime;

  /// Statements for the given table name. Throws ConfigurationError when the
  /// name is empty after trimming.
  static SessionQueries forTable(const std::string& sTableName);

  /// Throws ConfigurationError naming the first empty statement.
  void validate() const;

  /// Multi-row form of sCreateSessionAttribute for iRows attribute rows:
  /// the VALUES tuple is repeated with parameters renumbered consecutively
  /// and any clause after it is kept. nullopt when the statement has no
  /// VALUES tuple.
  std::optional<std::string> createSessionAttributeBatch(int iRows) const;
};

}  // namespace sessiondb::dal
