#include "objid/core/generator.hpp"

#include <atomic>
#include <random>

#include "objid/core/fnv.hpp"
#include "objid/util/byte_order.hpp"
#include "objid/util/hex.hpp"
#include "objid/util/logging.hpp"

namespace objid::core {

namespace {

constexpr const char* kFallbackHostname = "localhost";

std::uint32_t randomCounterSeed() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<std::uint32_t> dis(0, ObjectIdGenerator::kCounterModulus - 1);
  return dis(gen);
}

std::mutex& defaultMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<ObjectIdGenerator>& defaultSlot() {
  static std::unique_ptr<ObjectIdGenerator> slot;
  return slot;
}

std::atomic<ObjectIdGenerator*> g_default{nullptr};

}  // namespace

std::array<std::uint8_t, 3> machineBytesFor(std::string_view hostname) noexcept {
  std::uint8_t packed[4];
  util::storeLittleEndian32(fnv1a24(hostname), packed);
  return {packed[0], packed[1], packed[2]};
}

ObjectIdGenerator::ObjectIdGenerator(const IdentitySource& identity,
                                     std::optional<std::uint32_t> counter_seed,
                                     Clock clock)
    : clock_(std::move(clock)) {
  auto logger = util::Logging::logger();

  auto hostname = identity.hostname();
  if (!hostname) {
    logger->warn("Host name unavailable ({}), deriving machine bytes from '{}'",
                 hostname.error().message(), kFallbackHostname);
  }
  machine_bytes_ = machineBytesFor(hostname ? *hostname : kFallbackHostname);
  process_id_ = static_cast<std::uint16_t>(identity.processId() % 65536u);
  counter_ = counter_seed ? *counter_seed % kCounterModulus : randomCounterSeed();

  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }

  logger->debug("ObjectId generator ready: machine={} pid={} counter={}",
                util::toHex(machine_bytes_), process_id_, counter_);
}

std::uint32_t ObjectIdGenerator::nextCounter() {
  std::lock_guard<std::mutex> lock(counter_mutex_);
  std::uint32_t value = counter_;
  counter_ = (counter_ + 1) % kCounterModulus;
  if (counter_ == 0) {
    util::Logging::logger()->trace("ObjectId counter wrapped around");
  }
  return value;
}

ObjectId ObjectIdGenerator::generate() {
  ObjectId::Raw raw{};

  // 4 bytes current time, wrapped to 32 bits
  auto seconds = std::chrono::floor<std::chrono::seconds>(clock_()).time_since_epoch().count();
  util::storeBigEndian32(static_cast<std::uint32_t>(seconds), &raw[0]);

  // 3 bytes machine
  raw[4] = machine_bytes_[0];
  raw[5] = machine_bytes_[1];
  raw[6] = machine_bytes_[2];

  // 2 bytes pid
  util::storeBigEndian16(process_id_, &raw[7]);

  // 3 bytes counter
  util::storeBigEndian24(nextCounter(), &raw[9]);

  return ObjectId::fromRaw(raw);
}

ObjectIdGenerator& ObjectIdGenerator::processDefault() {
  if (auto* generator = g_default.load(std::memory_order_acquire)) {
    return *generator;
  }

  std::lock_guard<std::mutex> lock(defaultMutex());
  auto& slot = defaultSlot();
  if (!slot) {
    slot = std::make_unique<ObjectIdGenerator>(SystemIdentitySource{});
    g_default.store(slot.get(), std::memory_order_release);
  }
  return *slot;
}

Result<void> ObjectIdGenerator::configureProcessDefault(std::unique_ptr<ObjectIdGenerator> generator) {
  if (!generator) {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument, "Null ObjectId generator");
  }

  std::lock_guard<std::mutex> lock(defaultMutex());
  auto& slot = defaultSlot();
  if (slot) {
    return makeErrorResult<void>(ErrorCode::kInvalidState,
                                 "Process-default ObjectId generator is already in use");
  }
  slot = std::move(generator);
  g_default.store(slot.get(), std::memory_order_release);
  return {};
}

}  // namespace objid::core
