#ifndef XS_STORE_READ_OPTIONS_HPP
#define XS_STORE_READ_OPTIONS_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "store/frame.hpp"
#include "store/frame_id.hpp"

namespace xs {
namespace store {

enum class FollowMode {
  Off,
  On,
  WithHeartbeat
};

struct FollowOption {
  FollowMode mode = FollowMode::Off;
  // Pulse period, only meaningful for WithHeartbeat
  std::chrono::milliseconds interval{0};

  static FollowOption off() { return FollowOption{}; }
  static FollowOption on() { return FollowOption{FollowMode::On, std::chrono::milliseconds(0)}; }
  static FollowOption with_heartbeat(std::chrono::milliseconds interval) {
    return FollowOption{FollowMode::WithHeartbeat, interval};
  }

  bool enabled() const { return mode != FollowMode::Off; }

  bool operator==(const FollowOption& other) const {
    return mode == other.mode && (mode != FollowMode::WithHeartbeat || interval == other.interval);
  }
  bool operator!=(const FollowOption& other) const { return !(*this == other); }
};

// Maps a frame to its dedup key; frames without a key are left out of a compacted replay
using CompactionStrategy = std::function<std::optional<std::string>(const Frame&)>;

struct ReadOptions {
  FollowOption follow;
  // Skip replay and go straight to live frames
  bool tail = false;
  // Resume after this identifier (exclusive)
  std::optional<FrameId> last_id;
  CompactionStrategy compaction_strategy;

  // Decodes a URL query string such as "follow=5000&last-id=...".
  // Unknown keys are ignored. Throws std::invalid_argument on a bad value.
  static ReadOptions from_query(const std::optional<std::string>& query);
};

} // namespace store
} // namespace xs

#endif // XS_STORE_READ_OPTIONS_HPP
