#include "session/Session.hpp"

#include "common/Errors.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace sessiondb::session {

namespace {
common::TimePoint toMillis(common::TimePoint tp) {
  return std::chrono::floor<std::chrono::milliseconds>(tp);
}

bool isPrincipalBearing(const std::string& sName) {
  return sName == kPrincipalNameIndexName || sName == kSecurityContextAttribute;
}
}  // namespace

void requireStorableInterval(std::chrono::seconds durInterval) {
  if (durInterval.count() < std::numeric_limits<int32_t>::min() ||
      durInterval.count() > std::numeric_limits<int32_t>::max()) {
    throw common::ConfigurationError(
        "invalid_configuration",
        "Max inactive interval out of range for MAX_INACTIVE_INTERVAL: " +
            std::to_string(durInterval.count()) + "s");
  }
}

Session::Session(common::TimePoint tpNow)
    : _sid(SessionId::generate()),
      _tpCreationTime(toMillis(tpNow)),
      _tpLastAccessedTime(_tpCreationTime),
      _bIsNew(true) {}

Session::Session(SessionId sid, common::TimePoint tpCreationTime,
                 common::TimePoint tpLastAccessedTime,
                 std::chrono::seconds durMaxInactiveInterval)
    : _sid(sid),
      _tpCreationTime(toMillis(tpCreationTime)),
      _tpLastAccessedTime(toMillis(tpLastAccessedTime)),
      _durMaxInactiveInterval(durMaxInactiveInterval) {}

std::string Session::changeSessionId() {
  // Only the first rotation since the last save records the stored id
  if (!_oPreviousId.has_value() && !_bIsNew) {
    _oPreviousId = _sid;
  }
  _sid = SessionId::generate();
  _bChanged = true;
  return _sid.toString();
}

std::optional<nlohmann::json> Session::getAttribute(const std::string& sName) const {
  auto it = _mAttributes.find(sName);
  if (it == _mAttributes.end()) return std::nullopt;
  return it->second;
}

std::set<std::string> Session::getAttributeNames() const {
  std::set<std::string> stNames;
  for (const auto& [sName, _] : _mAttributes) {
    stNames.insert(sName);
  }
  return stNames;
}

void Session::setAttribute(const std::string& sName, nlohmann::json jValue) {
  // Both a new value and a null can change the resolved principal name
  if (isPrincipalBearing(sName)) {
    _bChanged = true;
  }
  if (jValue.is_null()) {
    removeAttribute(sName);
    return;
  }
  _mAttributes.insert_or_assign(sName, jValue);
  _mDelta.insert_or_assign(sName, std::move(jValue));
}

void Session::removeAttribute(const std::string& sName) {
  _mAttributes.erase(sName);
  _mDelta.insert_or_assign(sName, std::nullopt);
}

void Session::setLastAccessedTime(common::TimePoint tpLastAccessedTime) {
  _tpLastAccessedTime = toMillis(tpLastAccessedTime);
  _bChanged = true;
}

void Session::setMaxInactiveInterval(std::chrono::seconds durInterval) {
  requireStorableInterval(durInterval);
  _durMaxInactiveInterval = durInterval;
  _bChanged = true;
}

common::TimePoint Session::getExpiryTime() const {
  return _tpLastAccessedTime + _durMaxInactiveInterval;
}

bool Session::isExpired(common::TimePoint tpNow) const {
  if (neverExpires()) return false;
  return tpNow >= getExpiryTime();
}

void Session::clearChangeFlags() {
  _bIsNew = false;
  _bChanged = false;
  _oPreviousId.reset();
  _mDelta.clear();
}

void Session::loadAttribute(const std::string& sName, nlohmann::json jValue) {
  _mAttributes.insert_or_assign(sName, std::move(jValue));
}

}  // namespace sessiondb::session
