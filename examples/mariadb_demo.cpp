// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred MariaDB demo -- create, revoke and rotate via MySqlCredentialManager.
//
// Usage:
//   export SQLCRED_MARIA_DSN="localhost:3306:{{username}}:{{password}}:mysql"
//   export SQLCRED_MARIA_USER="vault-admin"
//   export SQLCRED_MARIA_PASSWORD="secret"
//   ./sqlcred_mariadb_demo [--rotate]
//
// --rotate changes SQLCRED_MARIA_USER's password and prints the new one.
// Do not point it at an account you cannot recover.

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "sqlcred/sqlcred.hpp"

static const char* GetEnvOr(const char* name, const char* fallback) {
  const char* value = std::getenv(name);
  return (value != nullptr) ? value : fallback;
}

int main(int argc, char** argv) {
  bool rotate = (argc > 1 && std::strcmp(argv[1], "--rotate") == 0);

  sqlcred::Logger::Init(GetEnvOr("SQLCRED_LOG_LEVEL", "info"));

  auto mgr = sqlcred::NewMySql();
  sqlcred::Error err = mgr->Initialize(
      {{"connection_url",
        GetEnvOr("SQLCRED_MARIA_DSN",
                 "localhost:3306:{{username}}:{{password}}:mysql")},
       {"username", GetEnvOr("SQLCRED_MARIA_USER", "root")},
       {"password", GetEnvOr("SQLCRED_MARIA_PASSWORD", "")},
       {"max_connection_lifetime", "5m"}},
      true);
  if (!err.ok()) {
    std::fprintf(stderr, "Initialize failed [%s]: %s\n",
                 sqlcred::ErrorCodeName(err.code), err.message);
    return 1;
  }
  std::printf("Connected as %s\n", mgr->Config().username.c_str());

  // Create
  sqlcred::Statements statements;
  statements.creation.push_back(
      "CREATE USER '{{name}}'@'%' IDENTIFIED BY '{{password}}'; "
      "GRANT SELECT ON *.* TO '{{name}}'@'%'");

  std::string user;
  std::string pass;
  err = mgr->CreateUser(sqlcred::Context::Background(), statements,
                        {"demo", "readonly"},
                        std::chrono::system_clock::now() + std::chrono::hours(1),
                        &user, &pass);
  if (!err.ok()) {
    std::fprintf(stderr, "CreateUser failed [%s]: %s\n",
                 sqlcred::ErrorCodeName(err.code), err.message);
    return 1;
  }
  std::printf("Created user %s (password %zu chars)\n", user.c_str(),
              pass.size());

  // Revoke with the built-in REVOKE ALL + DROP USER pair
  err = mgr->RevokeUser(sqlcred::Context::Background(), statements, user);
  if (!err.ok()) {
    std::fprintf(stderr, "RevokeUser failed [%s]: %s\n",
                 sqlcred::ErrorCodeName(err.code), err.message);
    return 1;
  }
  std::printf("Revoked user %s\n", user.c_str());

  if (rotate) {
    sqlcred::ConnectionConfig cfg;
    err = mgr->RotateRootCredentials(sqlcred::Context::Background(), {}, &cfg);
    if (!err.ok() && cfg.password == GetEnvOr("SQLCRED_MARIA_PASSWORD", "")) {
      std::fprintf(stderr, "Rotation failed [%s]: %s\n",
                   sqlcred::ErrorCodeName(err.code), err.message);
      return 1;
    }
    // A close error after commit still leaves the new password in effect.
    std::printf("Rotated %s, new password: %s\n", cfg.username.c_str(),
                cfg.password.c_str());
  }

  err = mgr->Close();
  if (!err.ok()) {
    std::fprintf(stderr, "Close failed: %s\n", err.message);
    return 1;
  }
  std::printf("\nDone.\n");
  return 0;
}
