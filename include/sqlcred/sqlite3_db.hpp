// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Sqlite3Db -- SQLite3 database connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Transaction support (Begin/Commit/Rollback); DDL is transactional,
//     which makes this backend the reference for all-or-nothing batches
//   - Zero global state, thread-safe per connection
//   - WatchContext() lets a Context interrupt a running statement
//
// Open() takes a file path or ":memory:".

#pragma once

#include <cstdint>
#include <string>

#include "sqlite3.h"

#include "sqlcred/context.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/sqlite3_statement.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() { static_cast<void>(Close()); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      static_cast<void>(Close());
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Error closed = Close();
    if (!closed.ok()) { return closed; }

    int32_t rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
      Error err = Error::MakeNative(
          ErrorCode::kConnection, rc,
          db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  /// Close the handle. Fails (and keeps the handle) while statements
  /// are still unfinalized.
  Error Close() {
    if (db_ == nullptr) { return Error::Ok(); }
    int32_t rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
      return Error::MakeNative(ErrorCode::kConnection, rc,
                               sqlite3_errmsg(db_));
    }
    db_ = nullptr;
    return Error::Ok();
  }

  bool IsOpen() const { return db_ != nullptr; }

  Error Ping() {
    Error err;
    ExecScalar("SELECT 1;", 0, &err);
    return err;
  }

  // --- DML ---

  /// Execute SQL directly (no prepare step visible to the caller).
  /// Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
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

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      out_error->SetNative(ErrorCode::kStatement,
                           sqlite3_extended_errcode(db_),
                           errmsg ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Scalar query ---

  /// Returns the first column of the first row as int32_t. A query that
  /// yields no row is an error.
  int32_t ExecScalar(const char* sql, int32_t null_value = 0,
                     Error* out_error = nullptr) {
    sqlite3_stmt* stmt = StepFirstRow(sql, out_error);
    if (stmt == nullptr) { return null_value; }
    int32_t value = (sqlite3_column_type(stmt, 0) == SQLITE_NULL)
                        ? null_value
                        : sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return value;
  }

  /// Text variant of ExecScalar().
  std::string ExecScalarText(const char* sql, const char* null_value = "",
                             Error* out_error = nullptr) {
    sqlite3_stmt* stmt = StepFirstRow(sql, out_error);
    if (stmt == nullptr) { return null_value; }
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    std::string value = (text != nullptr)
                            ? reinterpret_cast<const char*>(text)
                            : null_value;
    sqlite3_finalize(stmt);
    return value;
  }

  // --- Statement ---

  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return Sqlite3Statement{};
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return Sqlite3Statement{};
    }

    sqlite3_stmt* stmt = Compile(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Statement{}; }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("BEGIN TRANSACTION;", &err);
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT TRANSACTION;", &err);
    return err;
  }

  /// An interrupted write may already have rolled the transaction back;
  /// there is nothing left to undo then.
  Error Rollback() {
    if (db_ != nullptr && !InTransaction()) { return Error::Ok(); }
    Error err;
    ExecDml("ROLLBACK;", &err);
    return err;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  sqlite3* Handle() const { return db_; }

  // --- Cancellation ---

  /// While watched, a running statement is interrupted (SQLITE_INTERRUPT)
  /// as soon as ctx->Check() fails. nullptr stops watching.
  void WatchContext(const Context* ctx) {
    if (db_ == nullptr) { return; }
    if (ctx == nullptr) {
      sqlite3_progress_handler(db_, 0, nullptr, nullptr);
      return;
    }
    sqlite3_progress_handler(db_, kProgressOps, &Sqlite3Db::OnProgress,
                             const_cast<Context*>(ctx));
  }

 private:
  // Virtual machine instructions between two context checks.
  static constexpr int32_t kProgressOps = 1000;

  static int OnProgress(void* ctx) {
    return static_cast<const Context*>(ctx)->Check().ok() ? 0 : 1;
  }

  /// Prepare and step once. Returns the statement positioned on its first
  /// row, or nullptr with out_error set.
  sqlite3_stmt* StepFirstRow(const char* sql, Error* out_error) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return nullptr;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return nullptr;
    }

    sqlite3_stmt* stmt = Compile(sql, out_error);
    if (stmt == nullptr) { return nullptr; }

    int32_t rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW && sqlite3_column_count(stmt) > 0) {
      return stmt;
    }
    if (out_error != nullptr) {
      if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
        out_error->Set(ErrorCode::kStatement, "Invalid scalar query");
      } else {
        out_error->SetNative(ErrorCode::kStatement,
                             sqlite3_extended_errcode(db_),
                             sqlite3_errmsg(db_));
      }
    }
    sqlite3_finalize(stmt);
    return nullptr;
  }

  /// Prepare one statement. A blank/comment-only text prepares to a null
  /// handle, which is reported as misuse rather than returned as valid.
  sqlite3_stmt* Compile(const char* sql, Error* out_error) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      if (out_error != nullptr) {
        out_error->SetNative(ErrorCode::kStatement,
                             sqlite3_extended_errcode(db_),
                             sqlite3_errmsg(db_));
      }
      return nullptr;
    }
    if (stmt == nullptr && out_error != nullptr) {
      out_error->Set(ErrorCode::kMisuse, "sql contains no statement");
    }
    return stmt;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace sqlcred
