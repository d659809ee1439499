#include "store/frame.hpp"
#include "store/store_error.hpp"
#include <memory>
#include <stdexcept>

namespace xs {
namespace store {

namespace {

// Strict unsigned decimal; rejects signs, blanks and overflow
std::uint64_t parse_unsigned(const std::string& text, const std::string& token) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Invalid TTL value: '" + token + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("TTL value out of range: '" + token + "'");
  }
}

std::string write_compact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

} // namespace

//==============================================
// RETENTION POLICY
//==============================================

Ttl parse_ttl(const std::string& token) {
  if (token == "forever") {
    return ttl::Forever{};
  }
  if (token == "ephemeral") {
    return ttl::Ephemeral{};
  }
  if (token.rfind("time:", 0) == 0) {
    std::uint64_t seconds = parse_unsigned(token.substr(5), token);
    return ttl::Time{std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds))};
  }
  if (token.rfind("head:", 0) == 0) {
    std::uint64_t n = parse_unsigned(token.substr(5), token);
    if (n == 0) {
      throw std::invalid_argument("Invalid TTL value: head count must be at least 1");
    }
    return ttl::Head{n};
  }
  throw std::invalid_argument("Invalid TTL value: '" + token +
                              "', expected forever, ephemeral, time:<seconds> or head:<n>");
}

std::string to_string(const Ttl& value) {
  if (std::holds_alternative<ttl::Forever>(value)) {
    return "forever";
  }
  if (std::holds_alternative<ttl::Ephemeral>(value)) {
    return "ephemeral";
  }
  if (const auto* time = std::get_if<ttl::Time>(&value)) {
    return "time:" + std::to_string(time->duration.count());
  }
  return "head:" + std::to_string(std::get<ttl::Head>(value).n);
}


//==============================================
// FRAMES
//==============================================

bool Frame::operator==(const Frame& other) const {
  return id == other.id && topic == other.topic && hash == other.hash &&
         meta == other.meta && ttl == other.ttl;
}

std::ostream& operator<<(std::ostream& os, const Frame& frame) {
  return os << serialize_frame(frame);
}

Frame synthetic_frame(const FrameId& id, const std::string& topic) {
  Frame frame;
  frame.id = id;
  frame.topic = topic;
  return frame;
}


//==============================================
// SERIALIZATION
//==============================================

Json::Value frame_to_json(const Frame& frame) {
  Json::Value root(Json::objectValue);
  root["id"] = frame.id.to_string();
  root["topic"] = frame.topic;
  root["hash"] = frame.hash ? Json::Value(frame.hash->to_string()) : Json::Value(Json::nullValue);
  root["meta"] = frame.meta ? *frame.meta : Json::Value(Json::nullValue);
  if (frame.ttl) {
    root["ttl"] = to_string(*frame.ttl);
  }
  return root;
}

Frame frame_from_json(const Json::Value& value) {
  if (!value.isObject()) {
    throw std::invalid_argument("Frame: expected a JSON object");
  }
  if (!value["id"].isString() || !value["topic"].isString()) {
    throw std::invalid_argument("Frame: missing id or topic");
  }

  Frame frame;
  frame.id = FrameId::parse(value["id"].asString());
  frame.topic = value["topic"].asString();

  const Json::Value& hash = value["hash"];
  if (hash.isString()) {
    frame.hash = cas::Integrity::parse(hash.asString());
  } else if (!hash.isNull()) {
    throw std::invalid_argument("Frame: hash must be a string or null");
  }

  const Json::Value& meta = value["meta"];
  if (!meta.isNull()) {
    frame.meta = meta;
  }

  const Json::Value& ttl = value["ttl"];
  if (ttl.isString()) {
    frame.ttl = parse_ttl(ttl.asString());
  } else if (!ttl.isNull()) {
    throw std::invalid_argument("Frame: ttl must be a string");
  }
  return frame;
}

std::string serialize_frame(const Frame& frame) {
  return write_compact(frame_to_json(frame));
}

Frame deserialize_frame(const std::string& data) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;

  if (!reader->parse(data.data(), data.data() + data.size(), &root, &errors)) {
    throw CorruptionError("Failed to parse frame: " + errors + " in '" + data + "'");
  }
  try {
    return frame_from_json(root);
  } catch (const std::invalid_argument& e) {
    throw CorruptionError(std::string(e.what()) + " in '" + data + "'");
  }
}

} // namespace store
} // namespace xs
