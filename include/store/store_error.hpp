#ifndef XS_STORE_ERROR_HPP
#define XS_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xs {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// A persisted record could not be decoded
class CorruptionError : public StoreError {
public:
  explicit CorruptionError(const std::string& message)
    : StoreError("Corruption: " + message) {}
};

} // namespace store
} // namespace xs

#endif // XS_STORE_ERROR_HPP
