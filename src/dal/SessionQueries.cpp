#include "dal/SessionQueries.hpp"

#include "common/Errors.hpp"
#include "common/StringUtil.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace sessiondb::dal {

namespace {

constexpr const char* kTablePlaceholder = "%TABLE_NAME%";

constexpr const char* kCreateSessionQuery =
    "INSERT INTO %TABLE_NAME% (SESSION_ID1, SESSION_ID2, CREATION_TIME, LAST_ACCESS_TIME, "
    "MAX_INACTIVE_INTERVAL, EXPIRY_TIME, PRINCIPAL_NAME) "
    "VALUES ($1, $2, $3, $4, $5, $6, $7)";

constexpr const char* kCreateSessionAttributeQuery =
    "INSERT INTO %TABLE_NAME%_ATTRIBUTES (SESSION_ID1, SESSION_ID2, ATTRIBUTE_NAME, "
    "ATTRIBUTE_BYTES) "
    "VALUES ($1, $2, $3, $4)";

constexpr const char* kGetSessionQuery =
    "SELECT S.SESSION_ID1, S.SESSION_ID2, S.CREATION_TIME, S.LAST_ACCESS_TIME, "
    "S.MAX_INACTIVE_INTERVAL, SA.ATTRIBUTE_NAME, SA.ATTRIBUTE_BYTES "
    "FROM %TABLE_NAME% S "
    "LEFT OUTER JOIN %TABLE_NAME%_ATTRIBUTES SA "
    "ON S.SESSION_ID1 = SA.SESSION_ID1 AND S.SESSION_ID2 = SA.SESSION_ID2 "
    "WHERE S.SESSION_ID1 = $1 AND S.SESSION_ID2 = $2";

constexpr const char* kUpdateSessionQuery =
    "UPDATE %TABLE_NAME% SET SESSION_ID1 = $1, SESSION_ID2 = $2, LAST_ACCESS_TIME = $3, "
    "MAX_INACTIVE_INTERVAL = $4, EXPIRY_TIME = $5, PRINCIPAL_NAME = $6 "
    "WHERE SESSION_ID1 = $7 AND SESSION_ID2 = $8";

constexpr const char* kUpdateSessionAttributeQuery =
    "UPDATE %TABLE_NAME%_ATTRIBUTES SET ATTRIBUTE_BYTES = $1 "
    "WHERE SESSION_ID1 = $2 AND SESSION_ID2 = $3 AND ATTRIBUTE_NAME = $4";

constexpr const char* kDeleteSessionAttributeQuery =
    "DELETE FROM %TABLE_NAME%_ATTRIBUTES "
    "WHERE SESSION_ID1 = $1 AND SESSION_ID2 = $2 AND ATTRIBUTE_NAME = $3";

constexpr const char* kDeleteSessionQuery =
    "DELETE FROM %TABLE_NAME% WHERE SESSION_ID1 = $1 AND SESSION_ID2 = $2";

constexpr const char* kListSessionsByPrincipalNameQuery =
    "SELECT S.SESSION_ID1, S.SESSION_ID2, S.CREATION_TIME, S.LAST_ACCESS_TIME, "
    "S.MAX_INACTIVE_INTERVAL, SA.ATTRIBUTE_NAME, SA.ATTRIBUTE_BYTES "
    "FROM %TABLE_NAME% S "
    "LEFT OUTER JOIN %TABLE_NAME%_ATTRIBUTES SA "
    "ON S.SESSION_ID1 = SA.SESSION_ID1 AND S.SESSION_ID2 = SA.SESSION_ID2 "
    "WHERE S.PRINCIPAL_NAME = $1 "
    "ORDER BY S.SESSION_ID1, S.SESSION_ID2";

constexpr const char* kDeleteSessionsByExpiryTimeQuery =
    "DELETE FROM %TABLE_NAME% WHERE EXPIRY_TIME < $1";

std::string substituteTable(const std::string& sTemplate, const std::string& sTableName) {
  std::string sResult = sTemplate;
  const std::string sPlaceholder(kTablePlaceholder);
  for (size_t nPos = sResult.find(sPlaceholder); nPos != std::string::npos;
       nPos = sResult.find(sPlaceholder, nPos + sTableName.size())) {
    sResult.replace(nPos, sPlaceholder.size(), sTableName);
  }
  return sResult;
}

/// Rewrite every $N in sTuple as $(N + iOffset).
std::string renumberParams(const std::string& sTuple, int iOffset) {
  std::string sOut;
  sOut.reserve(sTuple.size() + 8);
  for (size_t i = 0; i < sTuple.size(); ++i) {
    if (sTuple[i] != '$' || i + 1 >= sTuple.size() ||
        !std::isdigit(static_cast<unsigned char>(sTuple[i + 1]))) {
      sOut.push_back(sTuple[i]);
      continue;
    }
    size_t nEnd = i + 1;
    while (nEnd < sTuple.size() && std::isdigit(static_cast<unsigned char>(sTuple[nEnd]))) {
      ++nEnd;
    }
    const int iParam = std::stoi(sTuple.substr(i + 1, nEnd - i - 1));
    sOut += "$" + std::to_string(iParam + iOffset);
    i = nEnd - 1;
  }
  return sOut;
}

int highestParam(const std::string& sTuple) {
  int iMax = 0;
  for (size_t i = 0; i < sTuple.size(); ++i) {
    if (sTuple[i] != '$') continue;
    size_t nEnd = i + 1;
    while (nEnd < sTuple.size() && std::isdigit(static_cast<unsigned char>(sTuple[nEnd]))) {
      ++nEnd;
    }
    if (nEnd > i + 1) {
      iMax = std::max(iMax, std::stoi(sTuple.substr(i + 1, nEnd - i - 1)));
    }
  }
  return iMax;
}

}  // namespace

SessionQueries SessionQueries::forTable(const std::string& sTableName) {
  const std::string sName = common::trim(sTableName);
  if (sName.empty()) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Table name must not be empty");
  }

  SessionQueries sq;
  sq.sCreateSession = substituteTable(kCreateSessionQuery, sName);
  sq.sCreateSessionAttribute = substituteTable(kCreateSessionAttributeQuery, sName);
  sq.sGetSession = substituteTable(kGetSessionQuery, sName);
  sq.sUpdateSession = substituteTable(kUpdateSessionQuery, sName);
  sq.sUpdateSessionAttribute = substituteTable(kUpdateSessionAttributeQuery, sName);
  sq.sDeleteSessionAttribute = substituteTable(kDeleteSessionAttributeQuery, sName);
  sq.sDeleteSession = substituteTable(kDeleteSessionQuery, sName);
  sq.sListSessionsByPrincipalName = substituteTable(kListSessionsByPrincipalNameQuery, sName);
  sq.sDeleteSessionsByExpiryTime = substituteTable(kDeleteSessionsByExpiryTimeQuery, sName);
  return sq;
}

void SessionQueries::validate() const {
  const std::vector<std::pair<const char*, const std::string*>> vStatements = {
      {"create session", &sCreateSession},
      {"create session attribute", &sCreateSessionAttribute},
      {"get session", &sGetSession},
      {"update session", &sUpdateSession},
      {"update session attribute", &sUpdateSessionAttribute},
      {"delete session attribute", &sDeleteSessionAttribute},
      {"delete session", &sDeleteSession},
      {"list sessions by principal name", &sListSessionsByPrincipalName},
      {"delete sessions by expiry time", &sDeleteSessionsByExpiryTime},
  };
  for (const auto& [pLabel, pText] : vStatements) {
    if (common::trim(*pText).empty()) {
      throw common::ConfigurationError(
          "invalid_configuration", std::string("Query must not be empty: ") + pLabel);
    }
  }
}

std::optional<std::string> SessionQueries::createSessionAttributeBatch(int iRows) const {
  std::string sUpper = sCreateSessionAttribute;
  std::transform(sUpper.begin(), sUpper.end(), sUpper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  const size_t nValues = sUpper.rfind("VALUES");
  if (nValues == std::string::npos) return std::nullopt;

  const size_t nTupleBegin = sCreateSessionAttribute.find('(', nValues);
  if (nTupleBegin == std::string::npos) return std::nullopt;

  size_t nTupleEnd = std::string::npos;
  int iDepth = 0;
  for (size_t i = nTupleBegin; i < sCreateSessionAttribute.size(); ++i) {
    if (sCreateSessionAttribute[i] == '(') {
      ++iDepth;
    } else if (sCreateSessionAttribute[i] == ')' && --iDepth == 0) {
      nTupleEnd = i;
      break;
    }
  }
  if (nTupleEnd == std::string::npos) return std::nullopt;

  const std::string sPrefix = sCreateSessionAttribute.substr(0, nTupleBegin);
  const std::string sTuple =
      sCreateSessionAttribute.substr(nTupleBegin, nTupleEnd - nTupleBegin + 1);
  const std::string sSuffix = sCreateSessionAttribute.substr(nTupleEnd + 1);
  const int iParamsPerRow = highestParam(sTuple);
  if (iParamsPerRow == 0) return std::nullopt;

  std::string sBatch = sPrefix;
  for (int iRow = 0; iRow < iRows; ++iRow) {
    if (iRow > 0) sBatch += ", ";
    sBatch += renumberParams(sTuple, iRow * iParamsPerRow);
  }
  return sBatch + sSuffix;
}

}  // namespace sessiondb::dal
