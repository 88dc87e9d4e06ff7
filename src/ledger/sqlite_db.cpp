#include "ledger/sqlite_db.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <sqlite3.h>

namespace chunkkeeper {

Statement::Statement(SqliteDatabase &db, const std::string &sql)
    : db_(db), sql_(sql) {
  int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    if (stmt_)
      sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    db_.fail(rc, "prepare '" + sql + "'");
  }
}

Statement::~Statement() {
  if (stmt_)
    sqlite3_finalize(stmt_);
}

Statement &Statement::bind(int index, int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, value);
  if (rc != SQLITE_OK)
    db_.fail(rc, "bind " + std::to_string(index) + " of '" + sql_ + "'");
  return *this;
}

Statement &Statement::bind(int index, const std::string &value) {
  int rc = sqlite3_bind_text(stmt_, index, value.c_str(),
                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK)
    db_.fail(rc, "bind " + std::to_string(index) + " of '" + sql_ + "'");
  return *this;
}

Statement &Statement::bind(int index, double value) {
  int rc = sqlite3_bind_double(stmt_, index, value);
  if (rc != SQLITE_OK)
    db_.fail(rc, "bind " + std::to_string(index) + " of '" + sql_ + "'");
  return *this;
}

Statement &Statement::bind(int index, std::optional<int64_t> value) {
  return value ? bind(index, *value) : bindNull(index);
}

Statement &Statement::bindNull(int index) {
  int rc = sqlite3_bind_null(stmt_, index);
  if (rc != SQLITE_OK)
    db_.fail(rc, "bind " + std::to_string(index) + " of '" + sql_ + "'");
  return *this;
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  db_.fail(rc, "step '" + sql_ + "'");
}

void Statement::exec() {
  while (step()) {
  }
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

int64_t Statement::columnInt64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

double Statement::columnDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

std::string Statement::columnText(int col) const {
  const unsigned char *text = sqlite3_column_text(stmt_, col);
  if (!text)
    return std::string();
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::columnIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<int64_t> Statement::columnOptionalInt64(int col) const {
  if (columnIsNull(col))
    return std::nullopt;
  return columnInt64(col);
}

SqliteDatabase::SqliteDatabase(const std::string &path, int busyTimeoutMs)
    : path_(path) {
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_)
      sqlite3_close(db_);
    db_ = nullptr;
    throw LedgerError("cannot open ledger database " + path + ": " + msg, rc);
  }
  sqlite3_busy_timeout(db_, busyTimeoutMs);
  if (path != ":memory:") {
    // WAL lets readers proceed while one writer holds the database.
    exec("PRAGMA journal_mode=WAL");
  }
  exec("PRAGMA synchronous=NORMAL");
  exec("PRAGMA foreign_keys=ON");
}

SqliteDatabase::~SqliteDatabase() {
  if (db_)
    sqlite3_close(db_);
}

void SqliteDatabase::exec(const std::string &sql) {
  auto lk = lock();
  char *errMsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string msg = errMsg ? errMsg : sqlite3_errstr(rc);
    sqlite3_free(errMsg);
    fail(rc, "exec: " + msg);
  }
}

int SqliteDatabase::changes() const { return sqlite3_changes(db_); }

int64_t SqliteDatabase::lastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

bool SqliteDatabase::inTransaction() const {
  return sqlite3_get_autocommit(db_) == 0;
}

void SqliteDatabase::fail(int rc, const std::string &context) {
  std::string msg = context + ": " + sqlite3_errmsg(db_);
  int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw LockContention("ledger busy: " + msg);
  }
  Logger::getInstance().log(LogLevel::ERROR, "[Ledger] sqlite error " +
                                                 std::to_string(rc) + " " + msg);
  throw LedgerError(msg, rc);
}

SqliteTransaction::SqliteTransaction(SqliteDatabase &db)
    : db_(db), lock_(db.lock()) {
  db_.exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_)
    return;
  char *errMsg = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &errMsg) !=
      SQLITE_OK) {
    std::string msg = errMsg ? errMsg : "unknown";
    sqlite3_free(errMsg);
    Logger::getInstance().log(LogLevel::ERROR,
                              "[Ledger] rollback failed: " + msg);
  }
}

void SqliteTransaction::commit() {
  db_.exec("COMMIT");
  done_ = true;
}

} // namespace chunkkeeper
