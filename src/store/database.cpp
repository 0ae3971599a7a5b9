#include "snip/store/database.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace snip::store {

// SQL schemas
namespace sql {

constexpr const char* kCreateSnipTable = R"(
CREATE TABLE IF NOT EXISTS snip (
  uuid TEXT,
  timestamp TEXT,
  name TEXT,
  data TEXT
)
)";

constexpr const char* kCreateAttachmentTable = R"(
CREATE TABLE IF NOT EXISTS snip_attachment (
  uuid TEXT,
  snip_uuid TEXT,
  timestamp TEXT,
  name TEXT,
  data BLOB,
  size INTEGER
)
)";

constexpr const char* kCreateIndexes = R"(
CREATE INDEX IF NOT EXISTS idx_snip_attachment_uuid ON snip_attachment(uuid);
CREATE INDEX IF NOT EXISTS idx_snip_attachment_snip_uuid ON snip_attachment(snip_uuid);
)";

}  // namespace sql

// Statement

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

Statement::~Statement() {
  finalize();
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    finalize();
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

void Statement::finalize() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Result<void> Statement::bindText(int index, std::string_view value) {
  int result = sqlite3_bind_text(stmt_, index, value.data(),
                                 static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to bind text parameter"));
  }
  return {};
}

Result<void> Statement::bindBlob(int index, std::string_view bytes) {
  // A null pointer would bind NULL instead of an empty blob
  static constexpr char kEmpty = '\0';
  const void* data = bytes.empty() ? static_cast<const void*>(&kEmpty) : bytes.data();

  int result = sqlite3_bind_blob(stmt_, index, data,
                                 static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to bind blob parameter"));
  }
  return {};
}

Result<void> Statement::bindInt64(int index, int64_t value) {
  int result = sqlite3_bind_int64(stmt_, index, value);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to bind integer parameter"));
  }
  return {};
}

Result<bool> Statement::step() {
  int result = sqlite3_step(stmt_);
  if (result == SQLITE_ROW) {
    return true;
  }
  if (result == SQLITE_DONE) {
    return false;
  }
  return std::unexpected(makeSqliteError("Failed to step statement"));
}

Result<void> Statement::execute() {
  while (true) {
    auto has_row = step();
    if (!has_row.has_value()) {
      return std::unexpected(has_row.error());
    }
    if (!*has_row) {
      return {};
    }
  }
}

std::string Statement::columnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (!text) {
    return "";
  }
  int length = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
}

std::string Statement::columnBlob(int column) const {
  const void* blob = sqlite3_column_blob(stmt_, column);
  int length = sqlite3_column_bytes(stmt_, column);
  if (!blob || length <= 0) {
    return "";
  }
  return std::string(static_cast<const char*>(blob), static_cast<size_t>(length));
}

int64_t Statement::columnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

bool Statement::columnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Error Statement::makeSqliteError(const std::string& operation) const {
  std::string message = operation;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

// Database

Database::Database(std::filesystem::path path, sqlite3* db)
    : path_(std::move(path)), db_(db) {}

Database::~Database() {
  if (db_) {
    int result = sqlite3_close(db_);
    if (result != SQLITE_OK) {
      spdlog::error("Failed to close database {}: {}", path_.string(), sqlite3_errstr(result));
    } else {
      spdlog::debug("Closed database {}", path_.string());
    }
  }
}

Result<std::unique_ptr<Database>> Database::open(const std::filesystem::path& path) {
  return open(path, Options{});
}

Result<std::unique_ptr<Database>> Database::open(const std::filesystem::path& path,
                                                 const Options& options) {
  // Ensure parent directory exists
  auto parent = path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                       "Failed to create database directory: " + ec.message()));
    }
  }

  sqlite3* handle = nullptr;
  int result = sqlite3_open_v2(path.c_str(), &handle,
                               SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (result != SQLITE_OK) {
    std::string message = "Failed to open database " + path.string() + ": " +
                          (handle ? sqlite3_errmsg(handle) : sqlite3_errstr(result));
    sqlite3_close(handle);
    spdlog::error(message);
    return std::unexpected(makeError(ErrorCode::kDatabaseError, message));
  }

  std::unique_ptr<Database> database(new Database(path, handle));

  auto config_result = database->configure(options);
  if (!config_result.has_value()) {
    return std::unexpected(config_result.error());
  }

  spdlog::debug("Opened database {}", path.string());
  return database;
}

Result<std::unique_ptr<Database>> Database::openInMemory() {
  sqlite3* handle = nullptr;
  int result = sqlite3_open(":memory:", &handle);
  if (result != SQLITE_OK) {
    std::string message = std::string("Failed to open in-memory database: ") +
                          (handle ? sqlite3_errmsg(handle) : sqlite3_errstr(result));
    sqlite3_close(handle);
    return std::unexpected(makeError(ErrorCode::kDatabaseError, message));
  }

  return std::unique_ptr<Database>(new Database(":memory:", handle));
}

Result<void> Database::configure(const Options& options) {
  int result = sqlite3_busy_timeout(db_, options.busy_timeout_ms);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to set busy timeout"));
  }

  // Values are validated by the config layer before they get here
  std::string pragmas = "PRAGMA journal_mode = " + options.journal_mode + ";\n" +
                        "PRAGMA synchronous = " + options.synchronous + ";\n";
  return exec(pragmas);
}

Result<void> Database::createSchema() {
  const char* schemas[] = {
    sql::kCreateSnipTable,
    sql::kCreateAttachmentTable,
    sql::kCreateIndexes
  };

  for (const char* schema : schemas) {
    auto result = exec(schema);
    if (!result.has_value()) {
      spdlog::error("Schema setup failed: {}", result.error().message());
      return result;
    }
  }

  spdlog::debug("Schema ready in {}", path_.string());
  return {};
}

Result<Statement> Database::prepare(std::string_view sql) {
  sqlite3_stmt* stmt = nullptr;
  int result = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
  if (result != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return std::unexpected(makeSqliteError("Failed to prepare statement"));
  }
  return Statement(db_, stmt);
}

Result<void> Database::exec(const std::string& sql) {
  char* error_message = nullptr;
  int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_message);
  if (result != SQLITE_OK) {
    std::string message = "Failed to execute SQL";
    if (error_message) {
      message += ": " + std::string(error_message);
      sqlite3_free(error_message);
    }
    return std::unexpected(makeError(ErrorCode::kDatabaseError, message));
  }
  return {};
}

int Database::changes() const {
  return sqlite3_changes(db_);
}

Error Database::makeSqliteError(const std::string& operation) const {
  std::string message = operation;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

}  // namespace snip::store
