#include "session/PrincipalNameResolver.hpp"

#include "session/Session.hpp"

#include <gtest/gtest.h>

#include <chrono>

using sessiondb::session::kPrincipalNameIndexName;
using sessiondb::session::kSecurityContextAttribute;
using sessiondb::session::resolvePrincipalName;
using sessiondb::session::Session;

TEST(PrincipalNameResolverTest, NoAttributesYieldsNothing) {
  Session ss(std::chrono::system_clock::now());
  EXPECT_FALSE(resolvePrincipalName(ss).has_value());
}

TEST(PrincipalNameResolverTest, IndexAttributeIsUsedVerbatim) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kPrincipalNameIndexName, "alice");
  EXPECT_EQ(resolvePrincipalName(ss), "alice");
}

TEST(PrincipalNameResolverTest, IndexAttributeWinsOverSecurityContext) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kSecurityContextAttribute, {{"authentication", {{"name", "bob"}}}});
  ss.setAttribute(kPrincipalNameIndexName, "alice");
  EXPECT_EQ(resolvePrincipalName(ss), "alice");
}

TEST(PrincipalNameResolverTest, FallsBackToAuthenticationName) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kSecurityContextAttribute,
                  {{"authentication", {{"name", "bob"}, {"authorities", {"ROLE_USER"}}}}});
  EXPECT_EQ(resolvePrincipalName(ss), "bob");
}

TEST(PrincipalNameResolverTest, SecurityContextWithoutAuthenticationYieldsNothing) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kSecurityContextAttribute, {{"details", "anonymous"}});
  EXPECT_FALSE(resolvePrincipalName(ss).has_value());
}

TEST(PrincipalNameResolverTest, NonStringAuthenticationNameYieldsNothing) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kSecurityContextAttribute, {{"authentication", {{"name", 42}}}});
  EXPECT_FALSE(resolvePrincipalName(ss).has_value());
}

TEST(PrincipalNameResolverTest, RemovedIndexAttributeNoLongerResolves) {
  Session ss(std::chrono::system_clock::now());
  ss.setAttribute(kPrincipalNameIndexName, "alice");
  ss.removeAttribute(kPrincipalNameIndexName);
  EXPECT_FALSE(resolvePrincipalName(ss).has_value());
}
