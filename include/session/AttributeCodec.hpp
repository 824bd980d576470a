#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace sessiondb::session {

/// Pure abstract interface converting attribute values to and from the opaque
/// bytes stored in ATTRIBUTE_BYTES. deserialize(serialize(v)) must equal v.
class IAttributeCodec {
 public:
  virtual ~IAttributeCodec() = default;

  virtual common::Bytes serialize(const nlohmann::json& jValue) const = 0;
  virtual nlohmann::json deserialize(const common::Bytes& vBytes) const = 0;
};

/// Default codec: RFC 8949 CBOR via nlohmann::json.
/// Throws SerializationError when the bytes are not valid CBOR.
class CborAttributeCodec : public IAttributeCodec {
 public:
  common::Bytes serialize(const nlohmann::json& jValue) const override;
  nlohmann::json deserialize(const common::Bytes& vBytes) const override;
};

}  // namespace sessiondb::session
