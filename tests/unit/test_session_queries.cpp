#include "dal/SessionQueries.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>

using sessiondb::common::ConfigurationError;
using sessiondb::dal::SessionQueries;

namespace {

bool contains(const std::string& sHaystack, const std::string& sNeedle) {
  return sHaystack.find(sNeedle) != std::string::npos;
}

}  // namespace

TEST(SessionQueriesTest, DefaultTableNameIsSubstitutedEverywhere) {
  auto sq = SessionQueries::forTable("SESSION_STORE");
  EXPECT_TRUE(contains(sq.sCreateSession, "INSERT INTO SESSION_STORE ("));
  EXPECT_TRUE(contains(sq.sCreateSessionAttribute, "INSERT INTO SESSION_STORE_ATTRIBUTES ("));
  EXPECT_TRUE(contains(sq.sGetSession, "FROM SESSION_STORE S"));
  EXPECT_TRUE(contains(sq.sGetSession, "LEFT OUTER JOIN SESSION_STORE_ATTRIBUTES SA"));
  EXPECT_TRUE(contains(sq.sDeleteSessionsByExpiryTime, "DELETE FROM SESSION_STORE WHERE"));
  EXPECT_FALSE(contains(sq.sListSessionsByPrincipalName, "%TABLE_NAME%"));
}

TEST(SessionQueriesTest, CustomTableNameIsTrimmed) {
  auto sq = SessionQueries::forTable("  APP_SESSIONS  ");
  EXPECT_TRUE(contains(sq.sDeleteSession, "DELETE FROM APP_SESSIONS WHERE"));
  EXPECT_TRUE(contains(sq.sUpdateSessionAttribute, "UPDATE APP_SESSIONS_ATTRIBUTES SET"));
}

TEST(SessionQueriesTest, EmptyTableNameIsRejected) {
  EXPECT_THROW(SessionQueries::forTable(""), ConfigurationError);
  EXPECT_THROW(SessionQueries::forTable(" \t "), ConfigurationError);
}

TEST(SessionQueriesTest, PrincipalListingIsOrderedById) {
  auto sq = SessionQueries::forTable("SESSION_STORE");
  EXPECT_TRUE(contains(sq.sListSessionsByPrincipalName, "WHERE S.PRINCIPAL_NAME = $1"));
  EXPECT_TRUE(contains(sq.sListSessionsByPrincipalName, "ORDER BY S.SESSION_ID1, S.SESSION_ID2"));
}

TEST(SessionQueriesTest, GeneratedStatementsValidate) {
  EXPECT_NO_THROW(SessionQueries::forTable("SESSION_STORE").validate());
}

TEST(SessionQueriesTest, EmptyStatementFailsValidation) {
  auto sq = SessionQueries::forTable("SESSION_STORE");
  sq.sDeleteSession = "   ";
  try {
    sq.validate();
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& ex) {
    EXPECT_TRUE(contains(ex.what(), "delete session"));
  }
}

TEST(SessionQueriesTest, SingleRowBatchEqualsStatement) {
  auto sq = SessionQueries::forTable("SESSION_STORE");
  auto oBatch = sq.createSessionAttributeBatch(1);
  ASSERT_TRUE(oBatch.has_value());
  EXPECT_EQ(*oBatch, sq.sCreateSessionAttribute);
}

TEST(SessionQueriesTest, BatchRenumbersParametersPerRow) {
  auto sq = SessionQueries::forTable("SESSION_STORE");
  auto oBatch = sq.createSessionAttributeBatch(3);
  ASSERT_TRUE(oBatch.has_value());
  EXPECT_TRUE(contains(*oBatch, "VALUES ($1, $2, $3, $4), ($5, $6, $7, $8), "
                                "($9, $10, $11, $12)"));
}

TEST(SessionQueriesTest, CustomAttributeInsertIsBatchedToo) {
  SessionQueries sq = SessionQueries::forTable("SESSION_STORE");
  sq.sCreateSessionAttribute =
      "insert into S_ATTRS (A, B, C, D) values ($1, $2, $3, $4) on conflict do nothing";
  auto oBatch = sq.createSessionAttributeBatch(2);
  ASSERT_TRUE(oBatch.has_value());
  EXPECT_TRUE(contains(*oBatch, "values ($1, $2, $3, $4), ($5, $6, $7, $8) on conflict"));
}

TEST(SessionQueriesTest, StatementWithoutValuesIsNotBatched) {
  SessionQueries sq = SessionQueries::forTable("SESSION_STORE");
  sq.sCreateSessionAttribute =
      "INSERT INTO S_ATTRS SELECT $1, $2, $3, $4 WHERE NOT EXISTS (SELECT 1)";
  EXPECT_FALSE(sq.createSessionAttributeBatch(2).has_value());
}
