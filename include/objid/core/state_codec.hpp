#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "objid/common.hpp"
#include "objid/core/object_id.hpp"

namespace objid::core {

// Key under which older releases stored the id inside a state mapping
constexpr std::string_view kLegacyStateKey = "_ObjectId__id";

// Opaque persisted state: a JSON binary value holding the 12 raw bytes
nlohmann::json encodeState(const ObjectId& id);

// Restore an id from persisted state. Forms are tried in this order:
//   1. binary value with the raw bytes (current form)
//   2. object holding form 1 or 3 under kLegacyStateKey
//   3. text whose code points are all <= U+00FF, one byte each (Latin-1)
// Fails with kInvalidState if no form matches or the result is not 12 bytes.
Result<ObjectId> decodeState(const nlohmann::json& state);

// Latin-1 re-encoding of UTF-8 text; fails on code points above U+00FF
Result<Bytes> latin1Bytes(std::string_view utf8);

}  // namespace objid::core

namespace nlohmann {

// {"$oid": "<hex>"}; from_json also accepts a bare hex string
template <>
struct adl_serializer<objid::core::ObjectId> {
  static void to_json(json& j, const objid::core::ObjectId& id);
  static objid::core::ObjectId from_json(const json& j);
};

}  // namespace nlohmann
