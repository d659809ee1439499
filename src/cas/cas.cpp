#include "cas/cas.hpp"
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace xs {
namespace cas {

namespace {

constexpr std::size_t BUFFER_SIZE = 8192;

std::filesystem::path path_for_integrity(const std::filesystem::path& root, const Integrity& integrity) {
  const std::string hex = integrity.hex();
  return root / "content" / Integrity::ALGORITHM / hex.substr(0, 2) / hex.substr(2, 2) / hex.substr(4);
}

void check_directory_exists(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::string random_name() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw CasError("CAS: Failed to generate temp file name");
  }
  std::stringstream ss;
  for (unsigned char b : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

} // namespace

//==============================================
// INTEGRITY
//==============================================

Integrity Integrity::parse(const std::string& text) {
  const std::string prefix = std::string(ALGORITHM) + "-";
  if (text.compare(0, prefix.size(), prefix) != 0) {
    throw std::invalid_argument("Integrity: unsupported algorithm in '" + text + "'");
  }

  const std::string encoded = text.substr(prefix.size());
  // 32 bytes encode to 44 base64 characters ending in a single '='
  if (encoded.size() != 44 || encoded.back() != '=' || encoded[42] == '=') {
    throw std::invalid_argument("Integrity: malformed digest in '" + text + "'");
  }

  std::array<unsigned char, 33> decoded{};
  int length = EVP_DecodeBlock(decoded.data(),
                               reinterpret_cast<const unsigned char*>(encoded.data()),
                               static_cast<int>(encoded.size()));
  if (length != 33) {
    throw std::invalid_argument("Integrity: malformed digest in '" + text + "'");
  }

  std::array<std::uint8_t, DIGEST_SIZE> digest{};
  std::copy(decoded.begin(), decoded.begin() + DIGEST_SIZE, digest.begin());
  Integrity integrity(digest);
  if (integrity.to_string() != text) {
    throw std::invalid_argument("Integrity: non-canonical digest '" + text + "'");
  }
  return integrity;
}

std::string Integrity::to_string() const {
  std::array<unsigned char, 45> encoded{};
  int length = EVP_EncodeBlock(encoded.data(), digest_.data(), static_cast<int>(digest_.size()));
  return std::string(ALGORITHM) + "-" + std::string(reinterpret_cast<const char*>(encoded.data()), length);
}

std::string Integrity::hex() const {
  std::stringstream ss;
  for (std::uint8_t b : digest_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Integrity& integrity) {
  return os << integrity.to_string();
}


//==============================================
// WRITER
//==============================================

Writer::Writer(const std::filesystem::path& root)
  : root_(root)
  , context_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
  if (!context_) {
    throw CasError("CAS: Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr)) {
    throw CasError("CAS: Failed to initialize hash context");
  }

  check_directory_exists(root_ / "tmp");
  temp_path_ = root_ / "tmp" / random_name();

  file_.open(temp_path_, std::ios::binary | std::ios::trunc);
  if (!file_) {
    throw CasError("CAS: Failed to create temp file: " + temp_path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "CAS: Opened writer at " << temp_path_.string();
}

Writer::Writer(Writer&& other) noexcept
  : root_(std::move(other.root_))
  , temp_path_(std::move(other.temp_path_))
  , file_(std::move(other.file_))
  , context_(std::move(other.context_))
  , bytes_written_(other.bytes_written_)
  , committed_(other.committed_) {
  // The moved-from writer owns nothing to clean up
  other.committed_ = true;
}

Writer::~Writer() {
  if (!committed_) {
    discard();
  }
}

void Writer::write(const char* data, std::size_t size) {
  if (committed_) {
    throw CasError("CAS: Write after commit");
  }
  if (size == 0) {
    return;
  }

  if (!EVP_DigestUpdate(context_.get(), data, size)) {
    throw CasError("CAS: Failed to update hash");
  }
  file_.write(data, static_cast<std::streamsize>(size));
  if (!file_) {
    throw CasError("CAS: Failed to write to " + temp_path_.string());
  }
  bytes_written_ += size;
}

Integrity Writer::commit() {
  if (committed_) {
    throw CasError("CAS: Writer already committed");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_.get(), hash, &hash_len) || hash_len != Integrity::DIGEST_SIZE) {
    throw CasError("CAS: Failed to finalize hash");
  }

  file_.flush();
  file_.close();
  if (file_.fail()) {
    throw CasError("CAS: Failed to flush " + temp_path_.string());
  }

  std::array<std::uint8_t, Integrity::DIGEST_SIZE> digest{};
  std::copy(hash, hash + Integrity::DIGEST_SIZE, digest.begin());
  Integrity integrity(digest);

  std::filesystem::path target = path_for_integrity(root_, integrity);
  check_directory_exists(target.parent_path());

  if (std::filesystem::exists(target)) {
    // Identical content is already stored
    discard();
  } else {
    // Readers only ever see complete files
    std::error_code ec;
    std::filesystem::rename(temp_path_, target, ec);
    if (ec) {
      throw CasError("CAS: Failed to move content into place: " + ec.message());
    }
  }

  committed_ = true;
  BOOST_LOG_TRIVIAL(debug) << "CAS: Committed " << bytes_written_ << " bytes as " << integrity;
  return integrity;
}

void Writer::discard() {
  if (file_.is_open()) {
    file_.close();
  }
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "CAS: Failed to remove temp file " << temp_path_.string()
                               << ": " << ec.message();
  }
}


//==============================================
// READER
//==============================================

Reader::Reader(const std::filesystem::path& path, const Integrity& integrity)
  : file_(path, std::ios::binary)
  , integrity_(integrity)
  , size_(std::filesystem::file_size(path)) {
  if (!file_) {
    throw CasError("CAS: Failed to open " + path.string());
  }
}

std::size_t Reader::read(char* buffer, std::size_t size) {
  if (!file_.good()) {
    return 0;
  }
  file_.read(buffer, static_cast<std::streamsize>(size));
  if (file_.bad()) {
    throw CasError("CAS: Failed to read content for " + integrity_.to_string());
  }
  return static_cast<std::size_t>(file_.gcount());
}

std::string Reader::read_to_end() {
  std::string content;
  char buffer[BUFFER_SIZE];
  std::size_t n = 0;
  while ((n = read(buffer, sizeof(buffer))) > 0) {
    content.append(buffer, n);
  }
  return content;
}


//==============================================
// CAS
//==============================================

Cas::Cas(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "CAS: Initializing CAS with root: " << root_.string();
  check_directory_exists(root_);
}

Writer Cas::writer() const {
  return Writer(root_);
}

std::optional<Reader> Cas::reader(const Integrity& integrity) const {
  std::filesystem::path path = content_path(integrity);
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "CAS: Content not found: " << integrity;
    return std::nullopt;
  }
  return Reader(path, integrity);
}

Integrity Cas::insert(const std::string& content) const {
  Writer w = writer();
  w.write(content);
  return w.commit();
}

std::optional<std::string> Cas::read(const Integrity& integrity) const {
  auto r = reader(integrity);
  if (!r) {
    return std::nullopt;
  }
  std::string content = r->read_to_end();

  // Verify the bytes still hash to the requested digest
  std::array<std::uint8_t, Integrity::DIGEST_SIZE> digest{};
  unsigned int hash_len = 0;
  if (!EVP_Digest(content.data(), content.size(), digest.data(), &hash_len, EVP_sha256(), nullptr)) {
    throw CasError("CAS: Failed to hash content for verification");
  }
  if (Integrity(digest) != integrity) {
    BOOST_LOG_TRIVIAL(error) << "CAS: Integrity check failed for " << integrity;
    throw CasError("CAS: Integrity check failed for " + integrity.to_string());
  }
  return content;
}

bool Cas::has(const Integrity& integrity) const {
  return std::filesystem::exists(content_path(integrity));
}

std::filesystem::path Cas::content_path(const Integrity& integrity) const {
  return path_for_integrity(root_, integrity);
}

} // namespace cas
} // namespace xs
