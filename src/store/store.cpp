#include "store/store.hpp"
#include "store/partition.hpp"
#include <boost/asio.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace xs {
namespace store {

namespace detail {

struct AppendCommand {
  FrameDraft draft;
  std::promise<Frame> reply;
};

struct ReadCommand {
  utils::Sender<Frame> reply;
  ReadOptions options;
};

using Command = std::variant<AppendCommand, ReadCommand>;

} // namespace detail

class Store::Actor {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Actor(const std::filesystem::path& path, const Config& config);
  // Drains queued commands, stops the loop and heartbeats, closes the partition
  ~Actor();

  Actor(const Actor&) = delete;
  Actor& operator=(const Actor&) = delete;


  // ---- CALLER-SIDE OPERATIONS ----
  Frame append(FrameDraft draft);
  utils::Receiver<Frame> read(ReadOptions options);
  std::optional<Frame> get(const FrameId& id) const;
  std::optional<Frame> head(const std::string& topic) const;

  const std::filesystem::path& path() const { return path_; }
  const cas::Cas& cas() const { return cas_; }

private:
  using Subscribers = std::vector<utils::Sender<Frame>>;

  // ---- PARAMETERS ----
  std::filesystem::path path_;
  Config config_;
  std::unique_ptr<Partition> partition_;
  cas::Cas cas_;
  FrameIdGenerator ids_;

  // Heartbeat timers
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

  utils::Sender<detail::Command> commands_;
  std::thread io_thread_;
  std::thread command_thread_;


  // ---- COMMAND LOOP ----
  void run(utils::Receiver<detail::Command> commands);
  void handle_append(detail::AppendCommand& command, Subscribers& subscribers);
  void handle_read(detail::ReadCommand& command, Subscribers& subscribers);
  // Streams persisted history to tx. Returns false once the reader is gone.
  bool replay(const utils::Sender<Frame>& tx, const ReadOptions& options);


  // ---- HEARTBEATS ----
  void start_heartbeat(utils::Sender<Frame> tx, std::chrono::milliseconds interval);
  void schedule_pulse(std::shared_ptr<boost::asio::steady_timer> timer, utils::Sender<Frame> tx,
                      std::chrono::milliseconds interval);
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Actor::Actor(const std::filesystem::path& path, const Config& config)
  : path_(path)
  , config_(config)
  , partition_(std::make_unique<Partition>(path / "partition" / "stream.db"))
  , cas_(path / "cacache")
  , work_(boost::asio::make_work_guard(io_context_)) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store at: " << path_.string();

  // Identifiers must keep increasing across restarts, even if the clock went back
  if (auto last = partition_->last()) {
    ids_.observe(FrameId::from_bytes(last->first));
    BOOST_LOG_TRIVIAL(debug) << "Store: Resuming after " << FrameId::from_bytes(last->first);
  }

  auto [sender, receiver] = utils::make_channel<detail::Command>(config_.command_capacity);
  commands_ = std::move(sender);

  io_thread_ = std::thread([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Store: Heartbeat IO context error: " << e.what();
    }
  });
  command_thread_ = std::thread(&Actor::run, this, std::move(receiver));
}

Store::Actor::~Actor() {
  BOOST_LOG_TRIVIAL(info) << "Store: Shutting down store at: " << path_.string();

  // Closing the command channel lets the loop finish what is already queued
  commands_.reset();
  if (command_thread_.joinable()) {
    command_thread_.join();
  }

  // Pending heartbeat timers are abandoned
  work_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}


//==============================================
// CALLER-SIDE OPERATIONS
//==============================================

Frame Store::Actor::append(FrameDraft draft) {
  std::promise<Frame> reply;
  std::future<Frame> result = reply.get_future();

  if (!commands_.send(detail::AppendCommand{std::move(draft), std::move(reply)})) {
    throw StoreError("Store: Command loop is not running");
  }
  // Rethrows a failed insert from the loop
  return result.get();
}

utils::Receiver<Frame> Store::Actor::read(ReadOptions options) {
  auto [tx, rx] = utils::make_channel<Frame>(config_.reply_capacity);

  if (!commands_.send(detail::ReadCommand{std::move(tx), std::move(options)})) {
    throw StoreError("Store: Command loop is not running");
  }
  return std::move(rx);
}

std::optional<Frame> Store::Actor::get(const FrameId& id) const {
  auto value = partition_->get(id.to_key());
  if (!value) {
    return std::nullopt;
  }
  return deserialize_frame(*value);
}

std::optional<Frame> Store::Actor::head(const std::string& topic) const {
  // Newest first, stop at the first match
  std::optional<Frame> found;
  partition_->scan(Bound::unbounded(), Bound::unbounded(), ScanOrder::Descending,
                   [&found, &topic](const std::string&, const std::string& value) {
                     Frame frame = deserialize_frame(value);
                     if (frame.topic != topic) {
                       return true;
                     }
                     found = std::move(frame);
                     return false;
                   });
  return found;
}


//==============================================
// COMMAND LOOP
//==============================================

void Store::Actor::run(utils::Receiver<detail::Command> commands) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Command loop started";

  // Only this thread touches the subscriber list and writes to the partition
  Subscribers subscribers;

  try {
    while (auto command = commands.recv()) {
      if (auto* append = std::get_if<detail::AppendCommand>(&*command)) {
        handle_append(*append, subscribers);
      } else {
        handle_read(std::get<detail::ReadCommand>(*command), subscribers);
      }
    }
  } catch (const StoreError& e) {
    // Persisted history can no longer be trusted or read
    BOOST_LOG_TRIVIAL(fatal) << "Store: " << e.what();
    boost::log::core::get()->flush();
    std::terminate();
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Command loop stopped with " << subscribers.size() << " subscribers";
}

void Store::Actor::handle_append(detail::AppendCommand& command, Subscribers& subscribers) {
  Frame frame;
  try {
    frame.id = ids_.generate();
    frame.topic = std::move(command.draft.topic);
    frame.hash = std::move(command.draft.hash);
    frame.meta = std::move(command.draft.meta);
    frame.ttl = std::move(command.draft.ttl);

    if (!frame.ttl || !is_ephemeral(*frame.ttl)) {
      partition_->insert(frame.id.to_key(), serialize_frame(frame));
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Append to topic '" << frame.topic << "' failed: " << e.what();
    command.reply.set_exception(std::current_exception());
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Appended " << frame.id << " on topic '" << frame.topic << "'";
  command.reply.set_value(frame);

  subscribers.erase(
    std::remove_if(subscribers.begin(), subscribers.end(),
                   [&frame](const utils::Sender<Frame>& tx) {
                     if (tx.send(frame)) {
                       return false;
                     }
                     BOOST_LOG_TRIVIAL(debug) << "Store: Subscriber went away, not retained";
                     return true;
                   }),
    subscribers.end());
}

void Store::Actor::handle_read(detail::ReadCommand& command, Subscribers& subscribers) {
  const ReadOptions& options = command.options;
  utils::Sender<Frame>& tx = command.reply;

  if (!options.tail) {
    try {
      if (!replay(tx, options)) {
        BOOST_LOG_TRIVIAL(debug) << "Store: Reader went away during replay";
        return;
      }
    } catch (const StoreError&) {
      throw;
    } catch (const std::exception& e) {
      // The reader sees this failure instead of a clean end of stream
      BOOST_LOG_TRIVIAL(error) << "Store: Replay failed: " << e.what();
      tx.close_with_error(std::current_exception());
      return;
    }
  }

  // Not following: dropping tx with the command ends the reader's stream
  if (!options.follow.enabled()) {
    return;
  }

  // Compacted replay does not line up with history, so there is no threshold to mark
  if (!options.tail && !options.compaction_strategy) {
    if (!tx.send(synthetic_frame(ids_.generate(), THRESHOLD_TOPIC))) {
      return;
    }
  }

  subscribers.push_back(tx);

  if (options.follow.mode == FollowMode::WithHeartbeat) {
    start_heartbeat(tx, options.follow.interval);
  }
}

bool Store::Actor::replay(const utils::Sender<Frame>& tx, const ReadOptions& options) {
  const Bound lower = options.last_id ? Bound::excluded(options.last_id->to_key()) : Bound::unbounded();

  std::unordered_map<std::string, Frame> compacted;
  bool delivered = true;

  partition_->scan(lower, Bound::unbounded(), ScanOrder::Ascending,
                   [&](const std::string&, const std::string& value) {
                     Frame frame = deserialize_frame(value);
                     if (options.compaction_strategy) {
                       // Later frames replace earlier ones with the same key
                       if (auto key = options.compaction_strategy(frame)) {
                         compacted.insert_or_assign(*key, std::move(frame));
                       }
                       return true;
                     }
                     delivered = tx.send(std::move(frame));
                     return delivered;
                   });

  if (!delivered) {
    return false;
  }
  for (auto& entry : compacted) {
    if (!tx.send(std::move(entry.second))) {
      return false;
    }
  }
  return true;
}


//==============================================
// HEARTBEATS
//==============================================

void Store::Actor::start_heartbeat(utils::Sender<Frame> tx, std::chrono::milliseconds interval) {
  // A zero period would spin the io thread
  interval = std::max(interval, std::chrono::milliseconds(1));

  boost::asio::post(io_context_, [this, tx = std::move(tx), interval]() mutable {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
    schedule_pulse(std::move(timer), std::move(tx), interval);
  });
}

void Store::Actor::schedule_pulse(std::shared_ptr<boost::asio::steady_timer> timer,
                                  utils::Sender<Frame> tx, std::chrono::milliseconds interval) {
  timer->expires_after(interval);
  timer->async_wait([this, timer, tx = std::move(tx), interval](const boost::system::error_code& ec) mutable {
    // Cancelled when the store shuts down
    if (ec) {
      return;
    }

    // Never block the io thread on a slow reader: a pulse that does not fit is skipped
    switch (tx.try_send(synthetic_frame(ids_.generate(), PULSE_TOPIC))) {
      case utils::SendResult::Closed:
        BOOST_LOG_TRIVIAL(debug) << "Store: Heartbeat stopped, reader went away";
        return;
      case utils::SendResult::Full:
        BOOST_LOG_TRIVIAL(trace) << "Store: Heartbeat skipped, reader channel full";
        break;
      case utils::SendResult::Sent:
        break;
    }
    schedule_pulse(timer, std::move(tx), interval);
  });
}


//==============================================
// STORE HANDLE
//==============================================

Store::Store(std::shared_ptr<Actor> actor) : actor_(std::move(actor)) {}

Store Store::spawn(const std::filesystem::path& path, const Config& config) {
  return Store(std::make_shared<Actor>(path, config));
}

Frame Store::append(FrameDraft draft) {
  return actor_->append(std::move(draft));
}

Frame Store::append_with_content(const std::string& topic, const std::string& content,
                                 std::optional<Json::Value> meta, std::optional<Ttl> ttl) {
  // The payload must be in the CAS before any reader can see the frame
  FrameDraft draft = FrameDraft::with_topic(topic);
  draft.hash = cas_insert(content);
  draft.meta = std::move(meta);
  draft.ttl = std::move(ttl);
  return append(std::move(draft));
}

utils::Receiver<Frame> Store::read(ReadOptions options) {
  return actor_->read(std::move(options));
}

std::optional<Frame> Store::get(const FrameId& id) const {
  return actor_->get(id);
}

std::optional<Frame> Store::head(const std::string& topic) const {
  return actor_->head(topic);
}

cas::Writer Store::cas_writer() const {
  return actor_->cas().writer();
}

std::optional<cas::Reader> Store::cas_reader(const cas::Integrity& integrity) const {
  return actor_->cas().reader(integrity);
}

cas::Integrity Store::cas_insert(const std::string& content) const {
  return actor_->cas().insert(content);
}

std::optional<std::string> Store::cas_read(const cas::Integrity& integrity) const {
  return actor_->cas().read(integrity);
}

const std::filesystem::path& Store::path() const {
  return actor_->path();
}

} // namespace store
} // namespace xs
