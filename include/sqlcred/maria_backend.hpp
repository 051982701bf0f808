// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Design:
//   - Aggregates all MariaDB-specific types into a single traits struct
//   - Used as template parameter for ConnectionProducer / CredentialManager
//   - Zero overhead: just type aliases and static predicates
//   - The only place that knows the server's "not supported in the
//     prepared statement protocol" error number

#pragma once

#include <mysqld_error.h>

#include "sqlcred/error.hpp"
#include "sqlcred/maria_db.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// MariaBackend -- type traits
// ---------------------------------------------------------------------------

struct MariaBackend {
  using Db        = MariaDb;
  using Statement = MariaStatement;

  static constexpr const char* kTypeName = "mysql";

  /// Error 1295: This command is not supported in the prepared statement
  /// protocol yet.
  static bool IsUnsupportedPreparedStatement(const Error& err) {
    return err.code == ErrorCode::kStatement &&
           err.native_code == ER_UNSUPPORTED_PS;
  }
};

}  // namespace sqlcred
