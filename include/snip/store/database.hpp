#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "snip/common.hpp"

namespace snip::store {

// Prepared statement owned for the lifetime of one query.
// Finalized on destruction, so every exit path releases it.
class Statement {
 public:
  ~Statement();

  // Non-copyable, movable
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  // Parameter binding (1-based indices, values are copied)
  Result<void> bindText(int index, std::string_view value);
  Result<void> bindBlob(int index, std::string_view bytes);
  Result<void> bindInt64(int index, int64_t value);

  // Advance one row: true if a row is available, false when done
  Result<bool> step();

  // Step until done, for statements that return no rows
  Result<void> execute();

  // Column accessors for the current row (0-based)
  std::string columnText(int column) const;
  std::string columnBlob(int column) const;
  int64_t columnInt64(int column) const;
  bool columnIsNull(int column) const;

 private:
  friend class Database;
  Statement(sqlite3* db, sqlite3_stmt* stmt);

  Error makeSqliteError(const std::string& operation) const;
  void finalize();

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// Owned SQLite connection.
// The caller constructs it and passes it to the stores that use it.
class Database {
 public:
  struct Options {
    std::string journal_mode = "WAL";
    std::string synchronous = "NORMAL";
    int busy_timeout_ms = 5000;
  };

  // Open (creating if needed) a database file
  static Result<std::unique_ptr<Database>> open(const std::filesystem::path& path,
                                                const Options& options);
  static Result<std::unique_ptr<Database>> open(const std::filesystem::path& path);

  // Private in-memory database, used by tests
  static Result<std::unique_ptr<Database>> openInMemory();

  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Create snip and attachment tables if absent
  Result<void> createSchema();

  // Prepare a single statement
  Result<Statement> prepare(std::string_view sql);

  // Execute one or more statements without results
  Result<void> exec(const std::string& sql);

  // Rows modified by the most recent INSERT, UPDATE or DELETE
  int changes() const;

  const std::filesystem::path& path() const { return path_; }

 private:
  Database(std::filesystem::path path, sqlite3* db);

  Result<void> configure(const Options& options);
  Error makeSqliteError(const std::string& operation) const;

  std::filesystem::path path_;
  sqlite3* db_ = nullptr;
};

}  // namespace snip::store
