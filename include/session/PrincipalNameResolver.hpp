#pragma once

#include <functional>
#include <optional>
#include <string>

namespace sessiondb::session {

class Session;

/// Produces the principal name persisted in PRINCIPAL_NAME for a session.
/// std::nullopt leaves the column NULL and the session out of the index.
using PrincipalNameResolver = std::function<std::optional<std::string>(const Session&)>;

/// Default resolution:
///   1. the principal-index attribute, when it holds a string, verbatim;
///   2. otherwise the string at /authentication/name inside the
///      security-context attribute;
///   3. otherwise nullopt.
std::optional<std::string> resolvePrincipalName(const Session& ssSession);

}  // namespace sessiondb::session
