// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Templated account SQL carries no bind parameters, so only
//     prepare -> ExecDml -> Finalize is exposed
//   - Failures carry the sqlite3 extended result code in native_code

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "sqlcred/error.hpp"

namespace sqlcred {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Execute the prepared statement. Returns affected row count, -1 on error.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return -1;
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      int32_t changes = sqlite3_changes(db_);
      sqlite3_reset(stmt_);
      return changes;
    }

    if (out_error != nullptr) {
      out_error->SetNative(ErrorCode::kStatement,
                           sqlite3_extended_errcode(db_),
                           sqlite3_errmsg(db_));
    }
    // Reset reports the same failure again; the step error is already kept.
    sqlite3_reset(stmt_);
    return -1;
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace sqlcred
