#include "session/PrincipalNameResolver.hpp"

#include "session/Session.hpp"

#include <nlohmann/json.hpp>

namespace sessiondb::session {

namespace {
const nlohmann::json::json_pointer kAuthenticationNamePath("/authentication/name");
}  // namespace

std::optional<std::string> resolvePrincipalName(const Session& ssSession) {
  auto oPrincipal = ssSession.getAttribute(kPrincipalNameIndexName);
  if (oPrincipal.has_value() && oPrincipal->is_string()) {
    return oPrincipal->get<std::string>();
  }

  auto oContext = ssSession.getAttribute(kSecurityContextAttribute);
  if (!oContext.has_value() || !oContext->is_object()) {
    return std::nullopt;
  }
  if (!oContext->contains(kAuthenticationNamePath)) {
    return std::nullopt;
  }
  const auto& jName = oContext->at(kAuthenticationNamePath);
  if (!jName.is_string()) {
    return std::nullopt;
  }
  return jName.get<std::string>();
}

}  // namespace sessiondb::session
