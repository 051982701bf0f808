// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::MariaStatement -- prepared statement for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - Account SQL is rendered text with no parameter markers, so the
//     statement is executed as prepared without a bind step
//   - Failures carry mysql_stmt_errno() in native_code
//   - API-compatible with Sqlite3Statement for backend-generic code

#pragma once

#include <cstdint>

#include <mysql.h>

#include "sqlcred/error.hpp"

namespace sqlcred {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;

  ~MariaStatement() { Finalize(); }

  // Move
  MariaStatement(MariaStatement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  // --- Execute ---

  /// Execute the prepared statement. Returns affected row count, or -1.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return -1;
    }

    if (mysql_stmt_execute(stmt_) != 0) {
      if (out_error != nullptr) {
        out_error->SetNative(ErrorCode::kStatement,
                             static_cast<int32_t>(mysql_stmt_errno(stmt_)),
                             mysql_stmt_error(stmt_));
      }
      return -1;
    }

    int64_t affected = static_cast<int64_t>(mysql_stmt_affected_rows(stmt_));
    return static_cast<int32_t>(affected);
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class MariaDb;

  explicit MariaStatement(MYSQL_STMT* stmt) : stmt_(stmt) {}

  MYSQL_STMT* stmt_ = nullptr;
};

}  // namespace sqlcred
