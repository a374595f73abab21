#include "objid/core/state_codec.hpp"

#include <string>

namespace objid::core {

namespace {

constexpr const char* kOidKey = "$oid";

Result<ObjectId> fromStateBytes(const Bytes& bytes, std::string_view form) {
  if (bytes.size() != ObjectId::kSize) {
    return makeErrorResult<ObjectId>(
        ErrorCode::kInvalidState,
        "Persisted ObjectId (" + std::string(form) + ") holds " +
            std::to_string(bytes.size()) + " bytes, expected 12");
  }
  auto id = ObjectId::fromBytes(bytes);
  if (!id) {
    return makeErrorResult<ObjectId>(ErrorCode::kInvalidState, id.error().message());
  }
  return id;
}

Result<ObjectId> decodeFlatState(const nlohmann::json& state, std::string_view form) {
  if (state.is_binary()) {
    const auto& binary = state.get_binary();
    return fromStateBytes(Bytes(binary.begin(), binary.end()), form);
  }

  if (state.is_string()) {
    auto bytes = latin1Bytes(state.get_ref<const std::string&>());
    if (!bytes) {
      return makeErrorResult<ObjectId>(ErrorCode::kInvalidState,
                                       "Persisted ObjectId (" + std::string(form) +
                                           ") is not Latin-1 text: " + bytes.error().message());
    }
    return fromStateBytes(*bytes, form);
  }

  return makeErrorResult<ObjectId>(ErrorCode::kInvalidState,
                                   "Unrecognized persisted ObjectId (" + std::string(form) +
                                       ") of type " + state.type_name());
}

}  // namespace

nlohmann::json encodeState(const ObjectId& id) {
  const auto& raw = id.raw();
  return nlohmann::json::binary(std::vector<std::uint8_t>(raw.begin(), raw.end()));
}

Result<ObjectId> decodeState(const nlohmann::json& state) {
  if (state.is_object()) {
    auto it = state.find(std::string(kLegacyStateKey));
    if (it == state.end()) {
      return makeErrorResult<ObjectId>(ErrorCode::kInvalidState,
                                       "Persisted ObjectId mapping has no '" +
                                           std::string(kLegacyStateKey) + "' key");
    }
    return decodeFlatState(*it, "legacy mapping");
  }

  return decodeFlatState(state, state.is_binary() ? "binary" : "legacy text");
}

Result<Bytes> latin1Bytes(std::string_view utf8) {
  Bytes result;
  result.reserve(utf8.size());

  for (size_t i = 0; i < utf8.size(); ++i) {
    auto lead = static_cast<std::uint8_t>(utf8[i]);
    if (lead < 0x80) {
      result.push_back(lead);
      continue;
    }

    // Only two-byte sequences C2..C3 map into U+0080..U+00FF
    if ((lead == 0xC2 || lead == 0xC3) && i + 1 < utf8.size()) {
      auto trail = static_cast<std::uint8_t>(utf8[i + 1]);
      if ((trail & 0xC0) == 0x80) {
        result.push_back(static_cast<std::uint8_t>(((lead & 0x1F) << 6) | (trail & 0x3F)));
        ++i;
        continue;
      }
    }

    return makeErrorResult<Bytes>(ErrorCode::kParseError,
                                  "Character at offset " + std::to_string(i) +
                                      " is outside the Latin-1 range");
  }

  return result;
}

}  // namespace objid::core

namespace nlohmann {

void adl_serializer<objid::core::ObjectId>::to_json(json& j, const objid::core::ObjectId& id) {
  j = json{{"$oid", id.toHex()}};
}

objid::core::ObjectId adl_serializer<objid::core::ObjectId>::from_json(const json& j) {
  const json* hex = &j;
  if (j.is_object()) {
    auto it = j.find(objid::core::kOidKey);
    if (it == j.end()) {
      throw json::other_error::create(501, "ObjectId object requires a \"$oid\" member", &j);
    }
    hex = &*it;
  }

  if (!hex->is_string()) {
    throw json::type_error::create(302, std::string("ObjectId must be a hex string, not ") +
                                            hex->type_name(), &j);
  }

  auto id = objid::core::ObjectId::fromHex(hex->get_ref<const std::string&>());
  if (!id) {
    throw json::other_error::create(501, id.error().message(), &j);
  }
  return *id;
}

}  // namespace nlohmann
