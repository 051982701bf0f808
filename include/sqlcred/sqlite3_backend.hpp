// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Sqlite3Backend -- backend traits for SQLite3.
//
// Design:
//   - Aggregates all SQLite3-specific types into a single traits struct
//   - Used as template parameter for ConnectionProducer / CredentialManager
//   - Zero overhead: just type aliases and static predicates

#pragma once

#include "sqlcred/error.hpp"
#include "sqlcred/sqlite3_db.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// Sqlite3Backend -- type traits
// ---------------------------------------------------------------------------

struct Sqlite3Backend {
  using Db        = Sqlite3Db;
  using Statement = Sqlite3Statement;

  static constexpr const char* kTypeName = "sqlite3";

  /// SQLite prepares every statement it can execute.
  static bool IsUnsupportedPreparedStatement(const Error&) { return false; }
};

}  // namespace sqlcred
