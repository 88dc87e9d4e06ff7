#ifndef CHUNKKEEPER_SQLITE_DB_HPP
#define CHUNKKEEPER_SQLITE_DB_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkkeeper {

class SqliteDatabase;

/**
 * @brief Prepared statement bound to one SqliteDatabase.
 *
 * Parameters are 1-based as in the sqlite3 C API; columns are 0-based.
 */
class Statement {
public:
  Statement(SqliteDatabase &db, const std::string &sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement &bind(int index, int64_t value);
  Statement &bind(int index, const std::string &value);
  Statement &bind(int index, double value);
  Statement &bind(int index, std::optional<int64_t> value);
  Statement &bindNull(int index);

  /// Advance. @return true while a row is available.
  bool step();
  /// Run to completion, ignoring any rows.
  void exec();
  void reset();

  int64_t columnInt64(int col) const;
  double columnDouble(int col) const;
  std::string columnText(int col) const;
  bool columnIsNull(int col) const;
  std::optional<int64_t> columnOptionalInt64(int col) const;

private:
  SqliteDatabase &db_;
  sqlite3_stmt *stmt_{nullptr};
  std::string sql_;
};

/**
 * @brief Owning handle on a sqlite3 connection.
 *
 * One connection is shared by every component of a node. lock() serialises
 * access from threads of this process; BEGIN IMMEDIATE transactions together
 * with busy_timeout serialise writers across processes.
 */
class SqliteDatabase {
public:
  /// @param path File path, or ":memory:".
  explicit SqliteDatabase(const std::string &path, int busyTimeoutMs = 5000);
  ~SqliteDatabase();
  SqliteDatabase(const SqliteDatabase &) = delete;
  SqliteDatabase &operator=(const SqliteDatabase &) = delete;

  /// Execute one or more statements without results.
  void exec(const std::string &sql);

  std::unique_lock<std::recursive_mutex> lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  /// Rows modified by the most recent statement on this connection.
  int changes() const;
  int64_t lastInsertRowId() const;
  /// True while a transaction is open on this connection.
  bool inTransaction() const;

  const std::string &path() const { return path_; }
  sqlite3 *handle() { return db_; }

  /// Throw the exception matching @p rc. SQLITE_BUSY maps to LockContention.
  [[noreturn]] void fail(int rc, const std::string &context);

private:
  sqlite3 *db_{nullptr};
  std::string path_;
  std::recursive_mutex mutex_;
};

/**
 * @brief RAII `BEGIN IMMEDIATE` transaction.
 *
 * Rolls back on destruction unless commit() was called. Holds the
 * connection lock for its whole lifetime.
 */
class SqliteTransaction {
public:
  explicit SqliteTransaction(SqliteDatabase &db);
  ~SqliteTransaction();
  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction &operator=(const SqliteTransaction &) = delete;

  void commit();

private:
  SqliteDatabase &db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool done_{false};
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_SQLITE_DB_HPP
