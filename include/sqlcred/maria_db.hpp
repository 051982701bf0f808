// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::MariaDb -- MariaDB/MySQL database connection with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Every failure carries mysql_errno()/mysql_stmt_errno() in native_code
//   - Transaction support (Begin/Commit/Rollback)
//   - Zero global state, thread-safe per connection
//   - API-compatible with Sqlite3Db for backend-generic code
//   - WatchContext() arms a MariaCanceller for the running statement
//
// Open() takes a MariaDsn string, see maria_dsn.hpp.

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>

#include <mysql.h>

#include "sqlcred/context.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/maria_canceller.hpp"
#include "sqlcred/maria_dsn.hpp"
#include "sqlcred/maria_statement.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// MariaDb
// ---------------------------------------------------------------------------

class MariaDb {
 public:
  MariaDb() = default;

  ~MariaDb() { static_cast<void>(Close()); }

  // Move
  MariaDb(MariaDb&& other) noexcept
      : conn_(other.conn_),
        in_transaction_(other.in_transaction_),
        dsn_(std::move(other.dsn_)),
        canceller_(std::move(other.canceller_)) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
  }

  MariaDb& operator=(MariaDb&& other) noexcept {
    if (this != &other) {
      static_cast<void>(Close());
      conn_ = other.conn_;
      in_transaction_ = other.in_transaction_;
      dsn_ = std::move(other.dsn_);
      canceller_ = std::move(other.canceller_);
      other.conn_ = nullptr;
      other.in_transaction_ = false;
    }
    return *this;
  }

  // No copy
  MariaDb(const MariaDb&) = delete;
  MariaDb& operator=(const MariaDb&) = delete;

  // --- Open / Close ---

  /// Open connection. Format: "host:port:user:password:database"
  /// Fields can be empty. Minimal: "localhost:3306:root::mysql"
  Error Open(const char* dsn) {
    MariaDsn parsed;
    Error parse = MariaDsn::Parse(dsn, &parsed);
    if (!parse.ok()) { return parse; }
    static_cast<void>(Close());

    const char* password =
        parsed.password.empty() ? nullptr : parsed.password.c_str();
    const char* database =
        parsed.database.empty() ? nullptr : parsed.database.c_str();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kConnection, "mysql_init failed");
    }

    if (mysql_real_connect(conn_, parsed.host.c_str(), parsed.user.c_str(),
                           password, database, parsed.port, nullptr,
                           0) == nullptr) {
      Error err = Error::MakeNative(ErrorCode::kConnection,
                                    static_cast<int32_t>(mysql_errno(conn_)),
                                    mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    if (mysql_set_character_set(conn_, "utf8mb4") != 0) {
      Error err = Error::MakeNative(ErrorCode::kConnection,
                                    static_cast<int32_t>(mysql_errno(conn_)),
                                    mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    dsn_ = std::move(parsed);
    return Error::Ok();
  }

  /// mysql_close() cannot fail; the Error return matches Sqlite3Db.
  Error Close() {
    canceller_.reset();
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
    return Error::Ok();
  }

  bool IsOpen() const { return conn_ != nullptr; }

  Error Ping() {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (mysql_ping(conn_) != 0) {
      return Error::MakeNative(ErrorCode::kConnection,
                               static_cast<int32_t>(mysql_errno(conn_)),
                               mysql_error(conn_));
    }
    return Error::Ok();
  }

  // --- DML ---

  /// Execute SQL over the text protocol (no prepare).
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (conn_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return -1;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return -1;
    }

    if (mysql_query(conn_, sql) != 0) {
      SetLastError(out_error);
      return -1;
    }

    // Drain a result set, if the statement produced one.
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res != nullptr) {
      mysql_free_result(res);
    }

    int64_t affected = static_cast<int64_t>(mysql_affected_rows(conn_));
    return static_cast<int32_t>(affected);
  }

  // --- Statement ---

  /// Prepare a statement. A server that cannot prepare the command reports
  /// ER_UNSUPPORTED_PS (1295) in out_error->native_code.
  MariaStatement CompileStatement(const char* sql,
                                  Error* out_error = nullptr) {
    if (conn_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return MariaStatement{};
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return MariaStatement{};
    }

    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (stmt == nullptr) {
      SetLastError(out_error);
      return MariaStatement{};
    }

    if (mysql_stmt_prepare(stmt, sql,
                           static_cast<unsigned long>(std::strlen(sql))) != 0) {
      if (out_error != nullptr) {
        out_error->SetNative(ErrorCode::kStatement,
                             static_cast<int32_t>(mysql_stmt_errno(stmt)),
                             mysql_stmt_error(stmt));
      }
      mysql_stmt_close(stmt);
      return MariaStatement{};
    }

    return MariaStatement(stmt);
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("START TRANSACTION;", &err);
    if (err.ok()) { in_transaction_ = true; }
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT;", &err);
    if (err.ok()) { in_transaction_ = false; }
    return err;
  }

  Error Rollback() {
    Error err;
    ExecDml("ROLLBACK;", &err);
    in_transaction_ = false;
    return err;
  }

  bool InTransaction() const { return in_transaction_; }

  MYSQL* Handle() const { return conn_; }

  // --- Cancellation ---

  /// While watched, the running statement is killed from a side connection
  /// once ctx->Check() fails. nullptr stops watching.
  void WatchContext(const Context* ctx) {
    canceller_.reset();
    // Background() can never be cancelled.
    if (conn_ == nullptr || ctx == nullptr || ctx == &Context::Background()) {
      return;
    }
    canceller_ = std::unique_ptr<MariaCanceller>(
        new MariaCanceller(dsn_, mysql_thread_id(conn_), *ctx));
  }

 private:
  void SetLastError(Error* out_error) const {
    if (out_error == nullptr) { return; }
    out_error->SetNative(ErrorCode::kStatement,
                         static_cast<int32_t>(mysql_errno(conn_)),
                         mysql_error(conn_));
  }

  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
  MariaDsn dsn_;
  std::unique_ptr<MariaCanceller> canceller_;
};

}  // namespace sqlcred
