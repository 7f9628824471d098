#include "freq_store.hpp"
#include <sqlite3.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

struct FrequencyStore::Impl {
  sqlite3* db = nullptr;
  mutable int64_t total = -1; // cached SUM(count), -1 when stale
};

namespace {
void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + e);
  }
}
}

FrequencyStore::FrequencyStore(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw std::runtime_error("sqlite open failed: " + path);
  }
  try {
    ensure_schema();
  } catch (const std::exception&) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

FrequencyStore::~FrequencyStore() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void FrequencyStore::ensure_schema() {
  exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS words ("
    " word TEXT PRIMARY KEY,"
    " count INTEGER NOT NULL"
    ");");
}

void FrequencyStore::add_count(const std::string& word, int64_t count) {
  const char* sql =
    "INSERT INTO words (word, count) VALUES (?, ?) "
    "ON CONFLICT(word) DO UPDATE SET count = count + excluded.count;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &st, nullptr) != SQLITE_OK)
    throw std::runtime_error("sqlite prepare failed");
  std::string key = ascii_lower(word);
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 2, (sqlite3_int64)count);
  if (sqlite3_step(st) != SQLITE_DONE) {
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite insert failed");
  }
  sqlite3_finalize(st);
  impl_->total = -1;
}

size_t FrequencyStore::import_list(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("frequency list: cannot open " + path);

  exec(impl_->db, "BEGIN;");
  size_t n = 0;
  try {
    std::string line;
    while (std::getline(in, line)) {
      std::istringstream ls(line);
      std::string word;
      int64_t count = 0;
      if (!(ls >> word >> count) || count <= 0) continue;
      add_count(word, count);
      ++n;
    }
    exec(impl_->db, "COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(impl_->db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
  return n;
}

int64_t FrequencyStore::count(const std::string& word) const {
  const char* sql = "SELECT count FROM words WHERE word=?";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &st, nullptr) != SQLITE_OK)
    throw std::runtime_error("sqlite prepare failed");
  std::string key = ascii_lower(word);
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  int64_t c = 0;
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    c = sqlite3_column_int64(st, 0);
  } else if (rc != SQLITE_DONE) {
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite select failed");
  }
  sqlite3_finalize(st);
  return c;
}

int64_t FrequencyStore::total() const {
  if (impl_->total >= 0) return impl_->total;
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(impl_->db, "SELECT COALESCE(SUM(count), 0) FROM words", -1, &st, nullptr) != SQLITE_OK)
    throw std::runtime_error("sqlite prepare failed");
  int64_t t = 0;
  if (sqlite3_step(st) == SQLITE_ROW) t = sqlite3_column_int64(st, 0);
  sqlite3_finalize(st);
  impl_->total = t;
  return t;
}

double FrequencyStore::information(const std::string& word) const {
  int64_t c = count(word);
  int64_t t = total();
  if (c <= 0 || t <= 0) return INFO_HIGH;
  return clamp_information(-std::log2((double)c / (double)t));
}
