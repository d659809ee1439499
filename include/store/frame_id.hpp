#ifndef XS_STORE_FRAME_ID_HPP
#define XS_STORE_FRAME_ID_HPP

#include <array>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace xs {
namespace store {

// 128-bit time-ordered identifier (SCRU128 layout):
//   48-bit unix milliseconds | 24-bit counter_hi | 24-bit counter_lo | 32-bit entropy
// Stored big-endian, so bytewise order is generation order.
class FrameId {
public:
  static constexpr std::size_t SIZE = 16;
  static constexpr std::size_t STRING_LENGTH = 25;
  static constexpr std::uint64_t MAX_TIMESTAMP = 0xFFFFFFFFFFFFULL;
  static constexpr std::uint32_t MAX_COUNTER = 0xFFFFFF;

  // ---- CONSTRUCTORS ----
  FrameId() = default;
  explicit FrameId(const std::array<std::uint8_t, SIZE>& bytes) : bytes_(bytes) {}

  static FrameId from_fields(std::uint64_t timestamp, std::uint32_t counter_hi,
                             std::uint32_t counter_lo, std::uint32_t entropy);
  // Builds an identifier from its 16-byte key form; throws std::invalid_argument on bad size
  static FrameId from_bytes(const std::string& bytes);
  // Parses the 25-digit base-36 form; throws std::invalid_argument
  static FrameId parse(const std::string& text);


  // ---- FIELD ACCESS ----
  std::uint64_t timestamp() const;
  std::uint32_t counter_hi() const;
  std::uint32_t counter_lo() const;
  std::uint32_t entropy() const;

  const std::array<std::uint8_t, SIZE>& bytes() const { return bytes_; }
  // Bytes as a string, the partition key form
  std::string to_key() const;
  std::string to_string() const;


  // ---- COMPARISON ----
  bool operator==(const FrameId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const FrameId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const FrameId& other) const { return bytes_ < other.bytes_; }
  bool operator>(const FrameId& other) const { return other < *this; }
  bool operator<=(const FrameId& other) const { return !(other < *this); }
  bool operator>=(const FrameId& other) const { return !(*this < other); }

private:
  std::array<std::uint8_t, SIZE> bytes_{};
};

std::ostream& operator<<(std::ostream& os, const FrameId& id);

// Produces strictly increasing identifiers. Thread-safe.
class FrameIdGenerator {
public:
  FrameIdGenerator() = default;

  // New identifier stamped with the current system time
  FrameId generate();
  // New identifier for the given unix-millisecond timestamp. Never goes
  // backwards: a timestamp older than the last one reuses the last one.
  FrameId generate_at(std::uint64_t timestamp);
  // Makes every later identifier sort after id
  void observe(const FrameId& id);

private:
  std::mutex mutex_;
  std::uint64_t timestamp_{0};
  std::uint32_t counter_hi_{0};
  std::uint32_t counter_lo_{0};
  std::uint64_t ts_counter_hi_{0};

  static std::uint32_t random_bits(std::size_t bits);
};

} // namespace store
} // namespace xs

#endif // XS_STORE_FRAME_ID_HPP
