#include "objid/core/object_id.hpp"

#include <algorithm>
#include <sstream>

#include "objid/core/generator.hpp"
#include "objid/util/byte_order.hpp"
#include "objid/util/hex.hpp"

namespace objid::core {

namespace {

template <typename T>
Result<T> invalidId(const std::string& rendered) {
  return makeErrorResult<T>(ErrorCode::kInvalidId,
                            rendered + " is not a valid ObjectId, it must be a 12-byte input"
                            " or a 24-character hex string");
}

std::string quoted(std::string_view text) {
  return "'" + std::string(text) + "'";
}

std::string describeBytes(std::span<const std::uint8_t> bytes) {
  return "0x" + util::toHex(bytes) + " (" + std::to_string(bytes.size()) + " bytes)";
}

struct AlternativeName {
  std::string_view operator()(const std::monostate&) const { return "none"; }
  std::string_view operator()(const ObjectId&) const { return "ObjectId"; }
  std::string_view operator()(const Bytes&) const { return "bytes"; }
  std::string_view operator()(const std::string&) const { return "string"; }
  std::string_view operator()(std::int64_t) const { return "integer"; }
  std::string_view operator()(double) const { return "double"; }
  std::string_view operator()(bool) const { return "bool"; }
};

struct IsEmpty {
  bool operator()(const std::monostate&) const { return true; }
  bool operator()(const ObjectId&) const { return false; }
  bool operator()(const Bytes& bytes) const { return bytes.empty(); }
  bool operator()(const std::string& text) const { return text.empty(); }
  bool operator()(std::int64_t value) const { return value == 0; }
  bool operator()(double value) const { return value == 0.0; }
  bool operator()(bool value) const { return !value; }
};

}  // namespace

ObjectId ObjectId::generate() {
  return ObjectIdGenerator::processDefault().generate();
}

ObjectId ObjectId::fromRaw(const Raw& raw) noexcept {
  return ObjectId(raw);
}

Result<ObjectId> ObjectId::fromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kSize) {
    return invalidId<ObjectId>(describeBytes(bytes));
  }

  Raw raw;
  std::copy(bytes.begin(), bytes.end(), raw.begin());
  return ObjectId(raw);
}

Result<ObjectId> ObjectId::fromHex(std::string_view hex) {
  if (hex.size() != kHexLength) {
    return invalidId<ObjectId>(quoted(hex));
  }

  auto decoded = util::fromHex(hex);
  if (!decoded) {
    return invalidId<ObjectId>(quoted(hex));
  }

  return fromBytes(*decoded);
}

Result<ObjectId> ObjectId::from(const Candidate& candidate) {
  if (const auto* id = std::get_if<ObjectId>(&candidate)) {
    return *id;
  }
  if (const auto* bytes = std::get_if<Bytes>(&candidate)) {
    return fromBytes(*bytes);
  }
  if (const auto* text = std::get_if<std::string>(&candidate)) {
    return fromHex(*text);
  }

  return makeErrorResult<ObjectId>(
      ErrorCode::kTypeError,
      "id must be an instance of (bytes, string, ObjectId), not " +
          std::string(std::visit(AlternativeName{}, candidate)));
}

ObjectId ObjectId::fromDatetime(const util::CalendarTime& generation_time) {
  return fromDatetime(util::Time::toUtc(generation_time));
}

ObjectId ObjectId::fromDatetime(std::chrono::system_clock::time_point utc_time) {
  Raw raw{};
  auto seconds = std::chrono::floor<std::chrono::seconds>(utc_time).time_since_epoch().count();
  util::storeBigEndian32(static_cast<std::uint32_t>(seconds), &raw[0]);
  return ObjectId(raw);
}

bool ObjectId::isValid(const Candidate& candidate) {
  if (std::visit(IsEmpty{}, candidate)) {
    return false;
  }

  // from() reports bad input only as kInvalidId or kTypeError
  return from(candidate).has_value();
}

Result<ObjectId> ObjectId::validate(const Candidate& candidate) {
  if (const auto* id = std::get_if<ObjectId>(&candidate)) {
    return *id;
  }
  return makeErrorResult<ObjectId>(ErrorCode::kValidationError, "Not a valid ObjectId");
}

std::vector<Validator> ObjectId::validators() {
  return {&ObjectId::validate};
}

std::string ObjectId::toHex() const {
  return util::toHex(raw_);
}

std::string ObjectId::toDebugString() const {
  return "ObjectId('" + toHex() + "')";
}

std::int32_t ObjectId::timestamp() const noexcept {
  return static_cast<std::int32_t>(util::loadBigEndian32(&raw_[0]));
}

std::chrono::sys_seconds ObjectId::generationTime() const noexcept {
  return std::chrono::sys_seconds{std::chrono::seconds{timestamp()}};
}

std::array<std::uint8_t, 3> ObjectId::machineBytes() const noexcept {
  return {raw_[4], raw_[5], raw_[6]};
}

std::uint16_t ObjectId::processId() const noexcept {
  return util::loadBigEndian16(&raw_[7]);
}

std::uint32_t ObjectId::counter() const noexcept {
  return util::loadBigEndian24(&raw_[9]);
}

bool ObjectId::operator==(const ObjectId& other) const noexcept {
  return raw_ == other.raw_;
}

bool ObjectId::operator!=(const ObjectId& other) const noexcept {
  return !(*this == other);
}

bool ObjectId::operator<(const ObjectId& other) const noexcept {
  return raw_ < other.raw_;
}

bool ObjectId::operator<=(const ObjectId& other) const noexcept {
  return raw_ <= other.raw_;
}

bool ObjectId::operator>(const ObjectId& other) const noexcept {
  return raw_ > other.raw_;
}

bool ObjectId::operator>=(const ObjectId& other) const noexcept {
  return raw_ >= other.raw_;
}

std::size_t ObjectId::Hash::operator()(const ObjectId& id) const noexcept {
  std::string_view view(reinterpret_cast<const char*>(id.raw_.data()), id.raw_.size());
  return std::hash<std::string_view>{}(view);
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
  return os << id.toHex();
}

}  // namespace objid::core
