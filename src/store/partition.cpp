#include "store/partition.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <memory>

namespace xs {
namespace store {

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void throw_if(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw StoreError(std::string("Partition: ") + what + ": " + sqlite3_errmsg(db));
  }
}

void bind_blob(sqlite3_stmt* st, int idx, const std::string& data, sqlite3* db) {
  throw_if(sqlite3_bind_blob(st, idx, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT),
           db, "bind");
}

std::string column_blob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  int size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Partition::Partition(const std::filesystem::path& db_path) : path_(db_path) {
  BOOST_LOG_TRIVIAL(info) << "Partition: Opening partition at: " << path_.string();

  if (path_.has_parent_path() && !std::filesystem::exists(path_.parent_path())) {
    std::filesystem::create_directories(path_.parent_path());
  }

  int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("Partition: Failed to open " + path_.string() + ": " + msg);
  }

  try {
    configure();
    exec("CREATE TABLE IF NOT EXISTS records ("
         "key BLOB PRIMARY KEY NOT NULL, "
         "value BLOB NOT NULL) WITHOUT ROWID;");
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Partition::~Partition() {
  if (!db_) {
    return;
  }
  // Fold the WAL back into the main file so the data is durable on close
  if (sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr) != SQLITE_OK) {
    BOOST_LOG_TRIVIAL(warning) << "Partition: Checkpoint on close failed: " << sqlite3_errmsg(db_);
  }
  if (sqlite3_close(db_) != SQLITE_OK) {
    BOOST_LOG_TRIVIAL(error) << "Partition: Failed to close " << path_.string() << ": " << sqlite3_errmsg(db_);
  }
  BOOST_LOG_TRIVIAL(debug) << "Partition: Closed " << path_.string();
}


//==============================================
// CORE OPERATIONS
//==============================================

void Partition::insert(const std::string& key, const std::string& value) {
  Statement st(prepare("INSERT OR REPLACE INTO records(key, value) VALUES(?1, ?2);"), &sqlite3_finalize);
  bind_blob(st.get(), 1, key, db_);
  bind_blob(st.get(), 2, value, db_);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    throw StoreError(std::string("Partition: insert failed: ") + sqlite3_errmsg(db_));
  }
}

std::optional<std::string> Partition::get(const std::string& key) const {
  Statement st(prepare("SELECT value FROM records WHERE key = ?1;"), &sqlite3_finalize);
  bind_blob(st.get(), 1, key, db_);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    return column_blob(st.get(), 0);
  }
  if (rc != SQLITE_DONE) {
    throw StoreError(std::string("Partition: get failed: ") + sqlite3_errmsg(db_));
  }
  return std::nullopt;
}

void Partition::scan(const Bound& lower, const Bound& upper, ScanOrder order, const Visitor& visit) const {
  std::string sql = "SELECT key, value FROM records";
  std::string where;
  int index = 0;
  int lower_index = 0;
  int upper_index = 0;

  if (lower.kind != Bound::Kind::Unbounded) {
    lower_index = ++index;
    where += std::string("key ") + (lower.kind == Bound::Kind::Included ? ">=" : ">") + " ?" + std::to_string(lower_index);
  }
  if (upper.kind != Bound::Kind::Unbounded) {
    upper_index = ++index;
    if (!where.empty()) {
      where += " AND ";
    }
    where += std::string("key ") + (upper.kind == Bound::Kind::Included ? "<=" : "<") + " ?" + std::to_string(upper_index);
  }
  if (!where.empty()) {
    sql += " WHERE " + where;
  }
  sql += order == ScanOrder::Ascending ? " ORDER BY key ASC;" : " ORDER BY key DESC;";

  Statement st(prepare(sql), &sqlite3_finalize);
  if (lower_index) bind_blob(st.get(), lower_index, lower.key, db_);
  if (upper_index) bind_blob(st.get(), upper_index, upper.key, db_);

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    if (!visit(column_blob(st.get(), 0), column_blob(st.get(), 1))) {
      return;
    }
  }
  if (rc != SQLITE_DONE) {
    throw StoreError(std::string("Partition: scan failed: ") + sqlite3_errmsg(db_));
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<Partition::Record> Partition::last() const {
  std::optional<Record> record;
  scan(Bound::unbounded(), Bound::unbounded(), ScanOrder::Descending,
       [&record](const std::string& key, const std::string& value) {
         record.emplace(key, value);
         return false;
       });
  return record;
}

std::size_t Partition::size() const {
  Statement st(prepare("SELECT COUNT(*) FROM records;"), &sqlite3_finalize);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw StoreError(std::string("Partition: count failed: ") + sqlite3_errmsg(db_));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
}


//==============================================
// SQLITE SUPPORT
//==============================================

void Partition::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw StoreError("Partition: " + msg);
  }
}

sqlite3_stmt* Partition::prepare(const std::string& sql) const {
  sqlite3_stmt* stmt = nullptr;
  throw_if(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "prepare");
  return stmt;
}

void Partition::configure() {
  // WAL lets get/head readers run while the command loop appends
  exec("PRAGMA journal_mode=WAL;");
  // Every committed append reaches disk before the writer is answered
  exec("PRAGMA synchronous=FULL;");
  throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace store
} // namespace xs
