#ifndef XS_STORE_STORE_HPP
#define XS_STORE_STORE_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <json/json.h>
#include "cas/cas.hpp"
#include "store/frame.hpp"
#include "store/frame_id.hpp"
#include "store/read_options.hpp"
#include "store/store_error.hpp"
#include "utils/channel.hpp"

namespace xs {
namespace store {

struct Config {
  // Commands queued before append/read callers block
  std::size_t command_capacity = 32;
  // Frames queued on each reader's channel before the store blocks on it
  std::size_t reply_capacity = 100;
};

/*
  Handle to an event store rooted at a directory:
    {path}/partition/stream.db   ordered frame log
    {path}/cacache               content-addressed payloads

  Every append and read is serialized through one command loop thread, which
  assigns identifiers, persists frames and fans them out to live readers.
  Copies of a Store share the same command loop; it shuts down when the last
  copy goes away.
*/
class Store {
public:
  // ---- LIFECYCLE ----
  // Opens or creates the store at path and starts its command loop
  static Store spawn(const std::filesystem::path& path, const Config& config = Config());


  // ---- LOG OPERATIONS ----
  // Assigns the next identifier, persists (unless ephemeral) and fans out
  Frame append(FrameDraft draft);
  // Writes content to the CAS, then appends a frame referencing it
  Frame append_with_content(const std::string& topic, const std::string& content,
                            std::optional<Json::Value> meta = std::nullopt,
                            std::optional<Ttl> ttl = std::nullopt);
  // Replays history and/or follows live appends. Dropping the receiver cancels.
  utils::Receiver<Frame> read(ReadOptions options);
  std::optional<Frame> get(const FrameId& id) const;
  // Most recent persisted frame on topic
  std::optional<Frame> head(const std::string& topic) const;


  // ---- CAS OPERATIONS ----
  cas::Writer cas_writer() const;
  std::optional<cas::Reader> cas_reader(const cas::Integrity& integrity) const;
  cas::Integrity cas_insert(const std::string& content) const;
  std::optional<std::string> cas_read(const cas::Integrity& integrity) const;


  // ---- GETTERS ----
  const std::filesystem::path& path() const;

private:
  class Actor;

  explicit Store(std::shared_ptr<Actor> actor);

  std::shared_ptr<Actor> actor_;
};

} // namespace store
} // namespace xs

#endif // XS_STORE_STORE_HPP
