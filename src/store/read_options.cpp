#include "store/read_options.hpp"
#include <stdexcept>
#include "utils/url.hpp"

namespace xs {
namespace store {

namespace {

FollowOption parse_follow(const std::string& value) {
  if (value.empty() || value == "yes" || value == "true") {
    return FollowOption::on();
  }
  if (value == "false" || value == "no") {
    return FollowOption::off();
  }
  if (value.find_first_not_of("0123456789") == std::string::npos) {
    // Intervals beyond the signed millisecond range would wrap negative
    constexpr auto max_interval = static_cast<unsigned long long>(std::chrono::milliseconds::max().count());
    unsigned long long interval = 0;
    try {
      interval = std::stoull(value);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("Heartbeat interval out of range: '" + value + "'");
    }
    if (interval > max_interval) {
      throw std::invalid_argument("Heartbeat interval out of range: '" + value + "'");
    }
    return FollowOption::with_heartbeat(
      std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(interval)));
  }
  throw std::invalid_argument("Invalid value for follow option: '" + value + "'");
}

bool parse_bool(const std::string& value) {
  return !(value == "false" || value == "no" || value == "0");
}

} // namespace

ReadOptions ReadOptions::from_query(const std::optional<std::string>& query) {
  ReadOptions options;
  if (!query) {
    return options;
  }

  std::size_t start = 0;
  while (start <= query->size()) {
    std::size_t end = query->find('&', start);
    if (end == std::string::npos) {
      end = query->size();
    }
    const std::string pair = query->substr(start, end - start);
    start = end + 1;

    if (pair.empty()) {
      continue;
    }

    std::size_t eq = pair.find('=');
    const std::string key = utils::url_decode(pair.substr(0, eq), true);
    const std::string value = eq == std::string::npos ? std::string() : utils::url_decode(pair.substr(eq + 1), true);

    if (key == "follow") {
      options.follow = parse_follow(value);
    } else if (key == "tail") {
      options.tail = parse_bool(value);
    } else if (key == "last-id") {
      options.last_id = FrameId::parse(value);
    }
  }
  return options;
}

} // namespace store
} // namespace xs
