#ifndef XS_TEST_UTILS_HPP
#define XS_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "store/frame.hpp"
#include "utils/channel.hpp"

// Console logging at debug level for test runs
inline void init_logging() {
  xs::logger::init_console_logging(xs::logger::severity_level::debug);
}

// Fresh, empty directory under the system temp dir
inline std::filesystem::path make_test_dir(const std::string& prefix) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// Receives count frames, giving up on each after timeout
inline std::vector<xs::store::Frame> recv_frames(const xs::utils::Receiver<xs::store::Frame>& rx,
                                                 std::size_t count,
                                                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  std::vector<xs::store::Frame> frames;
  while (frames.size() < count) {
    auto frame = rx.recv_for(timeout);
    if (!frame) {
      break;
    }
    frames.push_back(std::move(*frame));
  }
  return frames;
}

// Receives until the stream ends
inline std::vector<xs::store::Frame> drain_frames(const xs::utils::Receiver<xs::store::Frame>& rx) {
  std::vector<xs::store::Frame> frames;
  while (auto frame = rx.recv_for(std::chrono::seconds(5))) {
    frames.push_back(std::move(*frame));
  }
  return frames;
}

inline std::vector<std::string> topics_of(const std::vector<xs::store::Frame>& frames) {
  std::vector<std::string> topics;
  for (const auto& frame : frames) {
    topics.push_back(frame.topic);
  }
  return topics;
}

#endif // XS_TEST_UTILS_HPP
