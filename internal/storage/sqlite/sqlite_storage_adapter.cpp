#include "sqlite_storage_adapter.hpp"

#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace practicedb::storage::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

// Smallest string above every key starting with prefix under memcmp
// ordering; nullopt when the scan has no upper end.
std::optional<std::string> UpperBound(std::string prefix) {
  while (!prefix.empty() && static_cast<unsigned char>(prefix.back()) == 0xFF) prefix.pop_back();
  if (prefix.empty()) return std::nullopt;
  prefix.back() = static_cast<char>(static_cast<unsigned char>(prefix.back()) + 1);
  return prefix;
}

std::string RangeClause(const std::optional<std::string>& upper) {
  return upper ? "key>=? AND key<?" : "key>=?";
}

void BindRange(sqlite3_stmt* st, const std::string& lower, const std::optional<std::string>& upper) {
  BindText(st, 1, lower);
  if (upper) BindText(st, 2, *upper);
}

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql) : db_(db), stmt_(db.Prepare(sql)) {
  }

  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void StepDone(const char* what) {
    const int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB&     db_;
  sqlite3_stmt* stmt_;
};

} // namespace

SqliteStorageAdapter::SqliteStorageAdapter(std::shared_ptr<SqliteDB> db, std::string key_prefix)
    : db_(std::move(db)), key_prefix_(std::move(key_prefix)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
}

std::string SqliteStorageAdapter::Namespaced(const std::string& key) const {
  return key_prefix_ + key;
}

std::optional<document::Value> SqliteStorageAdapter::Get(const std::string& key) {
  std::string json;
  try {
    Statement st(*db_, "SELECT value FROM kv WHERE key=?;");
    BindText(st.get(), 1, Namespaced(key));

    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
      PRACTICEDB_LOG_WARN("sqlite read failed", {observability::StringField("key", key), observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
      return std::nullopt;
    }
    json = ColText(st.get(), 0);
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_WARN("sqlite read failed", {observability::StringField("key", key), observability::ErrorField(e)});
    return std::nullopt;
  }

  document::Value value;
  try {
    document::FromJson(json, &value);
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_WARN("stored value is not valid JSON", {observability::StringField("key", key), observability::ErrorField(e)});
    return std::nullopt;
  }
  return value;
}

void SqliteStorageAdapter::Set(const std::string& key, const document::Value& value) {
  const auto json = document::ToJson(value);

  Statement st(*db_, "INSERT INTO kv(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  BindText(st.get(), 1, Namespaced(key));
  BindText(st.get(), 2, json);
  st.StepDone("sqlite write");
}

void SqliteStorageAdapter::Delete(const std::string& key) {
  Statement st(*db_, "DELETE FROM kv WHERE key=?;");
  BindText(st.get(), 1, Namespaced(key));
  st.StepDone("sqlite delete");
}

std::vector<std::string> SqliteStorageAdapter::Keys(const std::string& prefix) {
  std::vector<std::string> keys;
  const auto               lower = Namespaced(prefix);
  const auto               upper = UpperBound(lower);

  try {
    Statement st(*db_, "SELECT key FROM kv WHERE " + RangeClause(upper) + " ORDER BY key;");
    BindRange(st.get(), lower, upper);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      auto key = ColText(st.get(), 0);
      if (key.compare(0, lower.size(), lower) != 0) continue;
      keys.push_back(key.substr(key_prefix_.size()));
    }
    if (rc != SQLITE_DONE) {
      PRACTICEDB_LOG_WARN("sqlite key scan failed", {observability::StringField("prefix", prefix), observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
    }
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_WARN("sqlite key scan failed", {observability::StringField("prefix", prefix), observability::ErrorField(e)});
  }
  return keys;
}

void SqliteStorageAdapter::Clear(const std::string& prefix) {
  const auto lower = Namespaced(prefix);
  const auto upper = UpperBound(lower);

  Statement st(*db_, "DELETE FROM kv WHERE " + RangeClause(upper) + ";");
  BindRange(st.get(), lower, upper);
  st.StepDone("sqlite clear");
}

} // namespace practicedb::storage::sqlite
