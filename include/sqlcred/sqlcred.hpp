// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred -- single include for the credential lifecycle library.
//
// Design:
//   - Users include this single header and pick a backend alias
//   - SQLite3 is always available; MariaDB/MySQL requires
//     SQLCRED_HAS_MARIADB=1 (set by the build when the client is found)
//   - NewMySql() / NewMySqlLegacy() pick the current or legacy username
//     length profile at construction
//
// Usage (MariaDB/MySQL):
//   #include "sqlcred/sqlcred.hpp"
//   auto mgr = sqlcred::NewMySql();
//   mgr->Initialize({{"connection_url",
//                     "localhost:3306:{{username}}:{{password}}:mysql"},
//                    {"username", "root"}, {"password", "secret"}}, true);
//   std::string user, pass;
//   mgr->CreateUser(sqlcred::Context::Background(), statements, {"app", "ro"},
//                   std::chrono::system_clock::now() + std::chrono::hours(1),
//                   &user, &pass);

#pragma once

#include <memory>

#include "sqlcred/connection_config.hpp"
#include "sqlcred/context.hpp"
#include "sqlcred/credential_manager.hpp"
#include "sqlcred/credentials.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/sqlite3_backend.hpp"

#if defined(SQLCRED_HAS_MARIADB) && SQLCRED_HAS_MARIADB
#include "sqlcred/maria_backend.hpp"
#endif

namespace sqlcred {

// ---------------------------------------------------------------------------
// Backend aliases
// ---------------------------------------------------------------------------

using Sqlite3CredentialManager = CredentialManager<Sqlite3Backend>;

#if defined(SQLCRED_HAS_MARIADB) && SQLCRED_HAS_MARIADB
using MySqlCredentialManager = CredentialManager<MariaBackend>;

inline std::unique_ptr<MySqlCredentialManager> NewMySql() {
  return std::unique_ptr<MySqlCredentialManager>(
      new MySqlCredentialManager(kCurrentUsernamePolicy));
}

inline std::unique_ptr<MySqlCredentialManager> NewMySqlLegacy() {
  return std::unique_ptr<MySqlCredentialManager>(
      new MySqlCredentialManager(kLegacyUsernamePolicy));
}
#endif

}  // namespace sqlcred
