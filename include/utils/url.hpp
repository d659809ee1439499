#ifndef XS_UTILS_URL_HPP
#define XS_UTILS_URL_HPP

#include <string>

namespace xs {
namespace utils {

// Decodes %XX escapes. With plus_as_space ('+' in a query string) a '+' becomes a space.
// Throws std::invalid_argument on a truncated or non-hex escape.
std::string url_decode(const std::string& text, bool plus_as_space = false);

} // namespace utils
} // namespace xs

#endif // XS_UTILS_URL_HPP
