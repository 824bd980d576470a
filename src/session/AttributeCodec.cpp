#include "session/AttributeCodec.hpp"

#include "common/Errors.hpp"

#include <cstdint>
#include <vector>

namespace sessiondb::session {

common::Bytes CborAttributeCodec::serialize(const nlohmann::json& jValue) const {
  const std::vector<std::uint8_t> vCbor = nlohmann::json::to_cbor(jValue);
  common::Bytes vBytes;
  vBytes.reserve(vCbor.size());
  for (std::uint8_t b : vCbor) {
    vBytes.push_back(static_cast<std::byte>(b));
  }
  return vBytes;
}

nlohmann::json CborAttributeCodec::deserialize(const common::Bytes& vBytes) const {
  std::vector<std::uint8_t> vCbor;
  vCbor.reserve(vBytes.size());
  for (std::byte b : vBytes) {
    vCbor.push_back(static_cast<std::uint8_t>(b));
  }
  try {
    return nlohmann::json::from_cbor(vCbor);
  } catch (const nlohmann::json::exception& ex) {
    throw common::SerializationError(
        "serialization_failed",
        std::string("Cannot decode attribute value: ") + ex.what());
  }
}

}  // namespace sessiondb::session
