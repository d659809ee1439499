#ifndef XS_STORE_FRAME_HPP
#define XS_STORE_FRAME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <json/json.h>
#include "cas/cas.hpp"
#include "store/frame_id.hpp"

namespace xs {
namespace store {

// Reserved synthetic topics, never persisted
constexpr const char* THRESHOLD_TOPIC = "xs.threshold";
constexpr const char* PULSE_TOPIC = "xs.pulse";

// ---- RETENTION POLICY ----
namespace ttl {

// Kept until explicitly removed
struct Forever {};
// Delivered to live subscribers only, never persisted
struct Ephemeral {};
// Eligible for removal once duration has elapsed
struct Time {
  std::chrono::seconds duration;
};
// Only the newest n frames per topic are retained
struct Head {
  std::uint64_t n;
};

inline bool operator==(const Forever&, const Forever&) { return true; }
inline bool operator==(const Ephemeral&, const Ephemeral&) { return true; }
inline bool operator==(const Time& a, const Time& b) { return a.duration == b.duration; }
inline bool operator==(const Head& a, const Head& b) { return a.n == b.n; }

} // namespace ttl

using Ttl = std::variant<ttl::Forever, ttl::Ephemeral, ttl::Time, ttl::Head>;

// Parses "forever", "ephemeral", "time:<seconds>" or "head:<n>"; throws std::invalid_argument
Ttl parse_ttl(const std::string& token);
std::string to_string(const Ttl& ttl);
inline bool is_ephemeral(const Ttl& ttl) { return std::holds_alternative<ttl::Ephemeral>(ttl); }


// ---- FRAMES ----
struct Frame {
  FrameId id;
  std::string topic;
  std::optional<cas::Integrity> hash;
  std::optional<Json::Value> meta;
  std::optional<Ttl> ttl;

  bool operator==(const Frame& other) const;
  bool operator!=(const Frame& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Frame& frame);

// A frame before the store has assigned its identifier
struct FrameDraft {
  std::string topic;
  std::optional<cas::Integrity> hash;
  std::optional<Json::Value> meta;
  std::optional<Ttl> ttl;

  static FrameDraft with_topic(std::string topic) {
    FrameDraft draft;
    draft.topic = std::move(topic);
    return draft;
  }
};

// Frame that only ever lives on subscriber channels
Frame synthetic_frame(const FrameId& id, const std::string& topic);


// ---- SERIALIZATION ----
Json::Value frame_to_json(const Frame& frame);
// Throws std::invalid_argument on a malformed document
Frame frame_from_json(const Json::Value& value);

// Compact single-line JSON, the persisted form
std::string serialize_frame(const Frame& frame);
// Throws CorruptionError
Frame deserialize_frame(const std::string& data);

} // namespace store
} // namespace xs

#endif // XS_STORE_FRAME_HPP
