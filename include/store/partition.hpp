#ifndef XS_STORE_PARTITION_HPP
#define XS_STORE_PARTITION_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <sqlite3.h>

namespace xs {
namespace store {

// One end of a key range
struct Bound {
  enum class Kind {
    Unbounded,
    Included,
    Excluded
  };

  Kind kind = Kind::Unbounded;
  std::string key;

  static Bound unbounded() { return Bound{}; }
  static Bound included(std::string key) { return Bound{Kind::Included, std::move(key)}; }
  static Bound excluded(std::string key) { return Bound{Kind::Excluded, std::move(key)}; }
};

enum class ScanOrder {
  Ascending,
  Descending
};

/*
  Durable ordered key/value map over a SQLite database. Keys are BLOBs and
  compare bytewise. Safe to share between threads (serialized connection).
*/
class Partition {
public:
  using Record = std::pair<std::string, std::string>;
  // Return false to stop the scan
  using Visitor = std::function<bool(const std::string& key, const std::string& value)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Partition(const std::filesystem::path& db_path);
  // Checkpoints the write-ahead log and closes the database
  ~Partition();

  Partition(const Partition&) = delete;
  Partition& operator=(const Partition&) = delete;


  // ---- CORE OPERATIONS ----
  // Inserts or replaces the value stored under key
  void insert(const std::string& key, const std::string& value);
  std::optional<std::string> get(const std::string& key) const;
  void scan(const Bound& lower, const Bound& upper, ScanOrder order, const Visitor& visit) const;


  // ---- QUERY OPERATIONS ----
  // Record with the greatest key
  std::optional<Record> last() const;
  std::size_t size() const;
  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  sqlite3* db_ = nullptr;
  std::filesystem::path path_;


  // ---- SQLITE SUPPORT ----
  void exec(const std::string& sql);
  sqlite3_stmt* prepare(const std::string& sql) const;
  void configure();
};

} // namespace store
} // namespace xs

#endif // XS_STORE_PARTITION_HPP
