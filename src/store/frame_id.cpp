#include "store/frame_id.hpp"
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <stdexcept>

namespace xs {
namespace store {

namespace {

constexpr char DIGITS[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

// Allowed clock rollback before the generator stops trusting the clock
constexpr std::uint64_t ROLLBACK_ALLOWANCE = 10000;

int digit_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
  if (c >= 'a' && c <= 'z') return c - 'a' + 10;
  return -1;
}

} // namespace

//==============================================
// CONSTRUCTORS
//==============================================

FrameId FrameId::from_fields(std::uint64_t timestamp, std::uint32_t counter_hi,
                             std::uint32_t counter_lo, std::uint32_t entropy) {
  if (timestamp > MAX_TIMESTAMP || counter_hi > MAX_COUNTER || counter_lo > MAX_COUNTER) {
    throw std::invalid_argument("FrameId: field value out of range");
  }

  std::array<std::uint8_t, SIZE> bytes{};
  for (int i = 0; i < 6; ++i) {
    bytes[i] = static_cast<std::uint8_t>(timestamp >> (8 * (5 - i)));
  }
  for (int i = 0; i < 3; ++i) {
    bytes[6 + i] = static_cast<std::uint8_t>(counter_hi >> (8 * (2 - i)));
    bytes[9 + i] = static_cast<std::uint8_t>(counter_lo >> (8 * (2 - i)));
  }
  for (int i = 0; i < 4; ++i) {
    bytes[12 + i] = static_cast<std::uint8_t>(entropy >> (8 * (3 - i)));
  }
  return FrameId(bytes);
}

FrameId FrameId::from_bytes(const std::string& bytes) {
  if (bytes.size() != SIZE) {
    throw std::invalid_argument("FrameId: expected 16 bytes, got " + std::to_string(bytes.size()));
  }
  std::array<std::uint8_t, SIZE> raw{};
  for (std::size_t i = 0; i < SIZE; ++i) {
    raw[i] = static_cast<std::uint8_t>(bytes[i]);
  }
  return FrameId(raw);
}

FrameId FrameId::parse(const std::string& text) {
  if (text.size() != STRING_LENGTH) {
    throw std::invalid_argument("FrameId: invalid length: '" + text + "'");
  }

  std::array<std::uint8_t, SIZE> bytes{};
  for (char c : text) {
    int digit = digit_value(c);
    if (digit < 0) {
      throw std::invalid_argument("FrameId: invalid digit in '" + text + "'");
    }

    // bytes = bytes * 36 + digit
    unsigned int carry = static_cast<unsigned int>(digit);
    for (int i = SIZE - 1; i >= 0; --i) {
      carry += static_cast<unsigned int>(bytes[i]) * 36;
      bytes[i] = static_cast<std::uint8_t>(carry & 0xFF);
      carry >>= 8;
    }
    if (carry != 0) {
      throw std::invalid_argument("FrameId: value out of 128-bit range: '" + text + "'");
    }
  }
  return FrameId(bytes);
}


//==============================================
// FIELD ACCESS
//==============================================

std::uint64_t FrameId::timestamp() const {
  std::uint64_t value = 0;
  for (int i = 0; i < 6; ++i) {
    value = (value << 8) | bytes_[i];
  }
  return value;
}

std::uint32_t FrameId::counter_hi() const {
  return (static_cast<std::uint32_t>(bytes_[6]) << 16) |
         (static_cast<std::uint32_t>(bytes_[7]) << 8) | bytes_[8];
}

std::uint32_t FrameId::counter_lo() const {
  return (static_cast<std::uint32_t>(bytes_[9]) << 16) |
         (static_cast<std::uint32_t>(bytes_[10]) << 8) | bytes_[11];
}

std::uint32_t FrameId::entropy() const {
  return (static_cast<std::uint32_t>(bytes_[12]) << 24) |
         (static_cast<std::uint32_t>(bytes_[13]) << 16) |
         (static_cast<std::uint32_t>(bytes_[14]) << 8) | bytes_[15];
}

std::string FrameId::to_key() const {
  return std::string(bytes_.begin(), bytes_.end());
}

std::string FrameId::to_string() const {
  std::array<std::uint8_t, SIZE> value = bytes_;
  std::string text(STRING_LENGTH, '0');

  // Repeated long division of the big-endian value by 36
  for (int pos = STRING_LENGTH - 1; pos >= 0; --pos) {
    unsigned int remainder = 0;
    for (std::size_t i = 0; i < SIZE; ++i) {
      unsigned int current = (remainder << 8) | value[i];
      value[i] = static_cast<std::uint8_t>(current / 36);
      remainder = current % 36;
    }
    text[pos] = DIGITS[remainder];
  }
  return text;
}

std::ostream& operator<<(std::ostream& os, const FrameId& id) {
  return os << id.to_string();
}


//==============================================
// GENERATOR
//==============================================

FrameId FrameIdGenerator::generate() {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch());
  return generate_at(static_cast<std::uint64_t>(now.count()));
}

FrameId FrameIdGenerator::generate_at(std::uint64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (timestamp > timestamp_) {
    timestamp_ = timestamp;
    counter_lo_ = random_bits(24);
    if (timestamp_ - ts_counter_hi_ >= 1000) {
      ts_counter_hi_ = timestamp_;
      counter_hi_ = random_bits(24);
    }
  } else {
    if (timestamp + ROLLBACK_ALLOWANCE <= timestamp_) {
      BOOST_LOG_TRIVIAL(warning) << "FrameId: Clock moved back by " << (timestamp_ - timestamp)
                                 << "ms, keeping last timestamp";
    }
    // Same (or earlier) millisecond: bump the counters, carrying into the timestamp
    if (++counter_lo_ > FrameId::MAX_COUNTER) {
      counter_lo_ = 0;
      if (++counter_hi_ > FrameId::MAX_COUNTER) {
        counter_hi_ = 0;
        ++timestamp_;
        counter_lo_ = random_bits(24);
      }
    }
  }

  return FrameId::from_fields(timestamp_, counter_hi_, counter_lo_, random_bits(32));
}

void FrameIdGenerator::observe(const FrameId& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  const FrameId last = FrameId::from_fields(timestamp_, counter_hi_, counter_lo_, 0xFFFFFFFF);
  if (id <= last) {
    return;
  }
  timestamp_ = id.timestamp();
  counter_hi_ = id.counter_hi();
  counter_lo_ = id.counter_lo();
  ts_counter_hi_ = timestamp_;
}

std::uint32_t FrameIdGenerator::random_bits(std::size_t bits) {
  std::array<unsigned char, 4> buffer{};
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("FrameId: Failed to generate random bytes");
  }
  std::uint32_t value = (static_cast<std::uint32_t>(buffer[0]) << 24) |
                        (static_cast<std::uint32_t>(buffer[1]) << 16) |
                        (static_cast<std::uint32_t>(buffer[2]) << 8) | buffer[3];
  return bits >= 32 ? value : (value & ((1U << bits) - 1));
}

} // namespace store
} // namespace xs
