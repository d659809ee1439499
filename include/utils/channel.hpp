#ifndef XS_UTILS_CHANNEL_HPP
#define XS_UTILS_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace xs {
namespace utils {

// Outcome of a non-blocking send
enum class SendResult {
  Sent,
  Full,
  Closed
};

namespace detail {

// Shared state behind a Sender/Receiver pair. Capacity 0 is a rendezvous:
// one item may sit in the queue, and its sender waits until it is taken.
template <typename T>
class ChannelState {
public:
  explicit ChannelState(std::size_t capacity) : capacity_(capacity) {}

  bool send(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return receivers_ == 0 || queue_.size() < slots(); });
    if (receivers_ == 0) {
      return false;
    }

    queue_.push_back(std::move(value));
    const std::uint64_t ticket = ++pushed_;
    not_empty_.notify_one();

    if (capacity_ == 0) {
      taken_.wait(lock, [this, ticket]() { return popped_ >= ticket || receivers_ == 0; });
      return popped_ >= ticket;
    }
    return true;
  }

  SendResult try_send(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receivers_ == 0) {
      return SendResult::Closed;
    }
    if (queue_.size() >= slots()) {
      return SendResult::Full;
    }
    queue_.push_back(std::move(value));
    ++pushed_;
    not_empty_.notify_one();
    return SendResult::Sent;
  }

  std::optional<T> recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return !queue_.empty() || senders_ == 0; });
    return pop_locked();
  }

  template <typename Rep, typename Period>
  std::optional<T> recv_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty() || senders_ == 0; });
    return pop_locked();
  }

  std::optional<T> try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receivers_ == 0;
  }

  bool is_disconnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return senders_ == 0;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  // Stored failure, raised to receivers once the queue drains and every sender is gone
  void set_error(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = std::move(error);
  }

  void add_sender() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++senders_;
  }

  void add_receiver() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++receivers_;
  }

  void remove_sender() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--senders_ == 0) {
      not_empty_.notify_all();
    }
  }

  void remove_receiver() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--receivers_ == 0) {
      queue_.clear();
      not_full_.notify_all();
      taken_.notify_all();
    }
  }

private:
  std::size_t slots() const { return capacity_ == 0 ? 1 : capacity_; }

  std::optional<T> pop_locked() {
    if (queue_.empty()) {
      if (senders_ == 0 && error_) {
        std::rethrow_exception(error_);
      }
      return std::nullopt;
    }
    std::optional<T> value(std::move(queue_.front()));
    queue_.pop_front();
    ++popped_;
    not_full_.notify_one();
    if (capacity_ == 0) {
      taken_.notify_all();
    }
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable taken_;
  std::deque<T> queue_;
  std::size_t senders_{0};
  std::size_t receivers_{0};
  std::uint64_t pushed_{0};
  std::uint64_t popped_{0};
  std::exception_ptr error_;
};

} // namespace detail

template <typename T>
class Receiver;

// Sending half of a channel. Copies share the channel; once every copy is
// gone, receivers drain what is queued and then observe end of stream.
template <typename T>
class Sender {
public:
  Sender() = default;

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
    if (state_) {
      state_->add_sender();
    }
  }

  Sender(const Sender& other) : Sender(other.state_) {}

  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(Sender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Sender() { reset(); }

  // Blocks while the channel is full. Returns false if every receiver is gone.
  bool send(T value) const {
    return state_ && state_->send(std::move(value));
  }

  SendResult try_send(T value) const {
    return state_ ? state_->try_send(std::move(value)) : SendResult::Closed;
  }

  bool is_closed() const { return !state_ || state_->is_closed(); }

  // Drops this handle, making receivers raise error after the queued values
  // instead of ending the stream normally
  void close_with_error(std::exception_ptr error) {
    if (state_) {
      state_->set_error(std::move(error));
      reset();
    }
  }

  // Drops this handle's share of the channel
  void reset() {
    if (state_) {
      state_->remove_sender();
      state_.reset();
    }
  }

  explicit operator bool() const { return static_cast<bool>(state_); }

private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Receiving half of a channel. Dropping the last copy closes the channel for
// its senders.
template <typename T>
class Receiver {
public:
  Receiver() = default;

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
    if (state_) {
      state_->add_receiver();
    }
  }

  Receiver(const Receiver& other) : Receiver(other.state_) {}

  Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}

  Receiver& operator=(Receiver other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Receiver() { reset(); }

  // Blocks until a value arrives. Empty once all senders are gone and the
  // queue is drained; rethrows the error a sender closed with, if any.
  std::optional<T> recv() const {
    return state_ ? state_->recv() : std::nullopt;
  }

  // Like recv(), but gives up after timeout
  template <typename Rep, typename Period>
  std::optional<T> recv_for(const std::chrono::duration<Rep, Period>& timeout) const {
    return state_ ? state_->recv_for(timeout) : std::nullopt;
  }

  std::optional<T> try_recv() const {
    return state_ ? state_->try_recv() : std::nullopt;
  }

  // True once every sender is gone (queued values may remain)
  bool is_disconnected() const { return !state_ || state_->is_disconnected(); }

  std::size_t size() const { return state_ ? state_->size() : 0; }

  void reset() {
    if (state_) {
      state_->remove_receiver();
      state_.reset();
    }
  }

  explicit operator bool() const { return static_cast<bool>(state_); }

private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Creates a channel holding at most capacity queued values
template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity) {
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace utils
} // namespace xs

#endif // XS_UTILS_CHANNEL_HPP
