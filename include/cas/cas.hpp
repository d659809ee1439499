#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

namespace xs {
namespace cas {

class CasError : public std::runtime_error {
public:
  explicit CasError(const std::string& message) : std::runtime_error(message) {}
};

// SHA-256 content digest, rendered as "sha256-<base64>"
class Integrity {
public:
  static constexpr std::size_t DIGEST_SIZE = 32;
  static constexpr const char* ALGORITHM = "sha256";

  Integrity() = default;
  explicit Integrity(const std::array<std::uint8_t, DIGEST_SIZE>& digest) : digest_(digest) {}

  // Parses "sha256-<base64>"; throws std::invalid_argument
  static Integrity parse(const std::string& text);

  const std::array<std::uint8_t, DIGEST_SIZE>& digest() const { return digest_; }
  std::string to_string() const;
  std::string hex() const;

  bool operator==(const Integrity& other) const { return digest_ == other.digest_; }
  bool operator!=(const Integrity& other) const { return digest_ != other.digest_; }

private:
  std::array<std::uint8_t, DIGEST_SIZE> digest_{};
};

std::ostream& operator<<(std::ostream& os, const Integrity& integrity);

// Streaming writer. Content becomes visible under its digest only on commit();
// a writer dropped before commit leaves nothing behind.
class Writer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Writer(const std::filesystem::path& root);
  ~Writer();

  Writer(Writer&& other) noexcept;
  Writer& operator=(Writer&&) = delete;
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;


  // ---- STREAMING ----
  void write(const char* data, std::size_t size);
  void write(const std::string& data) { write(data.data(), data.size()); }
  // Finalizes the digest and moves the content into place
  Integrity commit();

  std::size_t bytes_written() const { return bytes_written_; }

private:
  using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::filesystem::path temp_path_;
  std::ofstream file_;
  DigestContext context_;
  std::size_t bytes_written_{0};
  bool committed_{false};

  // Removes the temp file of an abandoned write
  void discard();
};

// Streaming reader over committed content
class Reader {
public:
  Reader(const std::filesystem::path& path, const Integrity& integrity);

  // Reads up to size bytes; returns 0 at end of content
  std::size_t read(char* buffer, std::size_t size);
  // Reads the remaining content
  std::string read_to_end();

  const Integrity& integrity() const { return integrity_; }
  std::uintmax_t size() const { return size_; }

private:
  std::ifstream file_;
  Integrity integrity_;
  std::uintmax_t size_;
};

// Content-addressed blob store:
//   {root}/content/sha256/{hex[0:2]}/{hex[2:4]}/{hex[4:]}
class Cas {
public:
  // ---- CONSTRUCTOR ----
  explicit Cas(const std::filesystem::path& root);


  // ---- STREAMING OPERATIONS ----
  Writer writer() const;
  // Empty when the digest is unknown
  std::optional<Reader> reader(const Integrity& integrity) const;


  // ---- WHOLE-BUFFER OPERATIONS ----
  Integrity insert(const std::string& content) const;
  // Empty when the digest is unknown; throws CasError if content no longer matches
  std::optional<std::string> read(const Integrity& integrity) const;


  // ---- QUERY OPERATIONS ----
  bool has(const Integrity& integrity) const;
  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path content_path(const Integrity& integrity) const;

private:
  std::filesystem::path root_;
};

} // namespace cas
} // namespace xs
