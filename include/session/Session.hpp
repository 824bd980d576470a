#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "session/SessionId.hpp"

namespace sessiondb::session {

/// Attribute name whose string value is the principal-name index key.
inline constexpr const char* kPrincipalNameIndexName = "PRINCIPAL_NAME_INDEX_NAME";

/// Attribute name holding the security context; the principal name is read
/// from its nested authentication name when no explicit index attribute is set.
inline constexpr const char* kSecurityContextAttribute = "SECURITY_CONTEXT";

/// Max inactive interval applied to sessions nobody configured explicitly.
inline constexpr std::chrono::seconds kDefaultMaxInactiveInterval{1800};

/// Throws ConfigurationError when the interval does not fit the 32-bit
/// MAX_INACTIVE_INTERVAL column.
void requireStorableInterval(std::chrono::seconds durInterval);

/// Attribute changes since the last save. A value of std::nullopt marks a
/// removed attribute (tombstone).
using AttributeDelta = std::unordered_map<std::string, std::optional<nlohmann::json>>;

/// In-memory session with attribute dirty tracking.
///
/// Timestamps are kept at millisecond precision, the precision they are
/// persisted with. A negative max inactive interval means the session never
/// expires.
/// Class abbreviation: ss
class Session {
 public:
  /// Fresh session: random id, creation and last access at tpNow, isNew() true.
  explicit Session(common::TimePoint tpNow);

  /// Session rehydrated from storage: isNew() false, empty delta.
  Session(SessionId sid, common::TimePoint tpCreationTime, common::TimePoint tpLastAccessedTime,
          std::chrono::seconds durMaxInactiveInterval);

  std::string getId() const { return _sid.toString(); }
  const SessionId& sessionId() const { return _sid; }

  /// Id last known to storage when the id was rotated since the last save.
  const std::optional<SessionId>& previousId() const { return _oPreviousId; }

  /// Assign a new random id and return its textual form. Storage is renamed
  /// on the next save; until then previousId() holds the stored id.
  std::string changeSessionId();

  std::optional<nlohmann::json> getAttribute(const std::string& sName) const;

  /// Typed attribute lookup. Returns nullopt when absent; throws
  /// nlohmann::json::type_error when the stored value has another type.
  template <typename T>
  std::optional<T> getAttributeAs(const std::string& sName) const {
    auto it = _mAttributes.find(sName);
    if (it == _mAttributes.end()) return std::nullopt;
    return it->second.get<T>();
  }

  std::set<std::string> getAttributeNames() const;
  const std::unordered_map<std::string, nlohmann::json>& attributes() const {
    return _mAttributes;
  }

  /// Store a value and record it in the delta. A JSON null removes the
  /// attribute instead. Writing the principal-index or security-context
  /// attribute, null included, marks the session changed.
  void setAttribute(const std::string& sName, nlohmann::json jValue);

  /// Drop an attribute and record a tombstone in the delta.
  void removeAttribute(const std::string& sName);

  common::TimePoint getCreationTime() const { return _tpCreationTime; }

  common::TimePoint getLastAccessedTime() const { return _tpLastAccessedTime; }
  void setLastAccessedTime(common::TimePoint tpLastAccessedTime);

  std::chrono::seconds getMaxInactiveInterval() const { return _durMaxInactiveInterval; }
  /// Throws ConfigurationError outside the 32-bit range of the stored column.
  void setMaxInactiveInterval(std::chrono::seconds durInterval);

  /// Last access time plus max inactive interval. Meaningless for a negative
  /// interval; see neverExpires().
  common::TimePoint getExpiryTime() const;
  bool neverExpires() const { return _durMaxInactiveInterval.count() < 0; }

  /// True iff tpNow >= getExpiryTime() and the session can expire.
  bool isExpired(common::TimePoint tpNow) const;

  bool isNew() const { return _bIsNew; }
  bool isChanged() const { return _bChanged; }
  const AttributeDelta& delta() const { return _mDelta; }

  /// Reset isNew, isChanged, previous id and delta. Called by the repository
  /// after a successful save.
  void clearChangeFlags();

  /// Populate an attribute while rehydrating from storage. Bypasses the delta.
  void loadAttribute(const std::string& sName, nlohmann::json jValue);

 private:
  SessionId _sid;
  std::optional<SessionId> _oPreviousId;
  common::TimePoint _tpCreationTime;
  common::TimePoint _tpLastAccessedTime;
  std::chrono::seconds _durMaxInactiveInterval = kDefaultMaxInactiveInterval;
  std::unordered_map<std::string, nlohmann::json> _mAttributes;
  AttributeDelta _mDelta;
  bool _bIsNew = false;
  bool _bChanged = false;
};

}  // namespace sessiondb::session
