// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::CredentialManager<Backend> -- dynamic account lifecycle against
// one logical database target: create, renew, revoke, rotate root.
//
// Design:
//   - One instance per database target; one mutex per instance serializes
//     create/revoke/rotate end to end, connection acquisition included
//   - Every state change runs in a single transaction guarded by
//     Transaction<Db>: either all rendered statements commit or none do
//   - Errors are returned, never retried: re-running CREATE USER or
//     ALTER USER blindly is not safe
//   - Passwords and rendered SQL are never logged
//
// Template placeholders:
//   CreateUser             {{name}} {{password}} {{expiration}}
//   RevokeUser             {{name}}
//   RotateRootCredentials  {{username}} {{password}}

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sqlcred/connection_config.hpp"
#include "sqlcred/connection_producer.hpp"
#include "sqlcred/context.hpp"
#include "sqlcred/credentials.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/logger.hpp"
#include "sqlcred/statement_template.hpp"
#include "sqlcred/transaction.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// Default statements (MySQL syntax)
// ---------------------------------------------------------------------------

// Accounts are assumed to be created for the '%' host only.
constexpr const char* kDefaultMySqlRevocationStatements =
    "REVOKE ALL PRIVILEGES, GRANT OPTION FROM '{{name}}'@'%'; "
    "DROP USER '{{name}}'@'%'";

constexpr const char* kDefaultMySqlRotateRootStatements =
    "ALTER USER '{{username}}'@'%' IDENTIFIED BY '{{password}}';";

/// Statement batches configured for a role.
struct Statements {
  std::vector<std::string> creation;
  std::vector<std::string> revocation;
};

// ---------------------------------------------------------------------------
// CredentialManager<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class CredentialManager {
 public:
  using DbType = typename Backend::Db;
  using TimePoint = std::chrono::system_clock::time_point;

  explicit CredentialManager(
      const UsernamePolicy& policy = kCurrentUsernamePolicy)
      : credentials_(policy) {}

  // Owns a mutex and a live connection: no copy, no move.
  CredentialManager(const CredentialManager&) = delete;
  CredentialManager& operator=(const CredentialManager&) = delete;

  const char* Type() const { return Backend::kTypeName; }

  const UsernamePolicy& Policy() const { return credentials_.Policy(); }

  Error Initialize(const Settings& settings, bool verify_connection,
                   const Context& ctx = Context::Background()) {
    std::lock_guard<std::mutex> lock(mutex_);
    return producer_.Initialize(settings, verify_connection, ctx);
  }

  /// Copy of the current connection config.
  ConnectionConfig Config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producer_.Config();
  }

  Error Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    return producer_.Close();
  }

  // --- Create ---

  /// Create a short-lived account from statements.creation. On success
  /// *out_username / *out_password hold the new credentials; on failure
  /// they are cleared and nothing has been committed.
  Error CreateUser(const Context& ctx, const Statements& statements,
                   const UsernameConfig& username_config, TimePoint expiration,
                   std::string* out_username, std::string* out_password) {
    if (out_username == nullptr || out_password == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "output is null");
    }
    out_username->clear();
    out_password->clear();

    std::lock_guard<std::mutex> lock(mutex_);

    if (statements.creation.empty()) {
      return Error::Make(ErrorCode::kEmptyStatement,
                         "empty creation statements");
    }

    std::string username;
    std::string password;
    std::string expiration_str;
    Error err = credentials_.GenerateUsername(username_config, &username);
    if (err.ok()) { err = credentials_.GeneratePassword(&password); }
    if (err.ok()) {
      err = credentials_.GenerateExpiration(expiration, &expiration_str);
    }
    if (!err.ok()) { return err; }

    std::vector<std::string> rendered = RenderBatch(
        statements.creation, {{"name", username},
                              {"password", password},
                              {"expiration", expiration_str}});
    if (rendered.empty()) {
      return Error::Make(ErrorCode::kEmptyStatement,
                         "creation statements contain no SQL");
    }

    Logger::Get()->debug("creating user {} ({} statements)", username,
                         rendered.size());
    err = RunInTransaction(ctx, rendered, ExecMode::kPreparedWithFallback);
    if (!err.ok()) {
      Logger::Get()->warn("create user {} failed [{}]: {}", username,
                          ErrorCodeName(err.code), err.message);
      return err;
    }

    Logger::Get()->info("created user {}", username);
    *out_username = std::move(username);
    *out_password = std::move(password);
    return Error::Ok();
  }

  // --- Renew ---

  /// Expiration is enforced by the caller's lease; nothing to do here.
  Error RenewUser(const Context&, const Statements&, const std::string&,
                  TimePoint) {
    return Error::Ok();
  }

  // --- Revoke ---

  /// Revoke an account with statements.revocation, or with the default
  /// REVOKE ALL + DROP USER pair when none are configured.
  Error RevokeUser(const Context& ctx, const Statements& statements,
                   const std::string& username) {
    if (username.empty()) {
      return Error::Make(ErrorCode::kMisuse, "username is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> batch = statements.revocation;
    if (batch.empty()) {
      batch.push_back(kDefaultMySqlRevocationStatements);
    }
    std::vector<std::string> rendered =
        RenderBatch(batch, {{"name", username}});
    if (rendered.empty()) {
      return Error::Make(ErrorCode::kEmptyStatement,
                         "revocation statements contain no SQL");
    }

    Logger::Get()->debug("revoking user {} ({} statements)", username,
                         rendered.size());
    Error err = RunInTransaction(ctx, rendered, ExecMode::kDirectOnly);
    if (!err.ok()) {
      Logger::Get()->warn("revoke user {} failed [{}]: {}", username,
                          ErrorCodeName(err.code), err.message);
      return err;
    }

    Logger::Get()->info("revoked user {}", username);
    return Error::Ok();
  }

  // --- Rotate root ---

  /// Set a new password for the configured root account. On success the
  /// live connection is closed so the next operation reconnects with the
  /// new password, and *out_config holds the updated config. On failure
  /// before commit *out_config holds the unchanged config.
  ///
  /// A kConnection error with an updated *out_config means the password
  /// change committed but closing the old connection failed; the new
  /// password is authoritative.
  Error RotateRootCredentials(const Context& ctx,
                              const std::vector<std::string>& statements,
                              ConnectionConfig* out_config) {
    if (out_config == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out_config is null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    *out_config = producer_.Config();

    if (!producer_.Initialized()) {
      return Error::Make(ErrorCode::kNotInitialized,
                         "connection producer not initialized");
    }
    if (!out_config->HasRootCredentials()) {
      return Error::Make(ErrorCode::kConfiguration,
                         "username and password are required to rotate");
    }

    std::vector<std::string> batch = statements;
    if (batch.empty()) {
      batch.push_back(kDefaultMySqlRotateRootStatements);
    }

    std::string password;
    Error err = credentials_.GeneratePassword(&password);
    if (!err.ok()) { return err; }

    std::vector<std::string> rendered = RenderBatch(
        batch, {{"username", out_config->username}, {"password", password}});
    // Nothing would change server side, so the stored password must not.
    if (rendered.empty()) {
      return Error::Make(ErrorCode::kEmptyStatement,
                         "rotation statements contain no SQL");
    }

    Logger::Get()->debug("rotating root credentials for {}",
                         out_config->username);
    err = RunInTransaction(ctx, rendered, ExecMode::kDirectOnly);
    if (!err.ok()) {
      Logger::Get()->warn("rotate root credentials failed [{}]: {}",
                          ErrorCodeName(err.code), err.message);
      return err;
    }

    // Committed: the new password is the only valid one from here on.
    producer_.UpdatePassword(password);
    *out_config = producer_.Config();

    err = producer_.Close();
    if (!err.ok()) {
      Logger::Get()->error(
          "root password rotated but closing the connection failed: {}",
          err.message);
      return err;
    }

    Logger::Get()->info("rotated root credentials for {}",
                        out_config->username);
    return Error::Ok();
  }

 private:
  /// Open a transaction on the live connection, run the batch, commit.
  /// Rolls back on every failure path.
  Error RunInTransaction(const Context& ctx,
                         const std::vector<std::string>& rendered,
                         ExecMode mode) {
    DbType* db = nullptr;
    Error err = producer_.Connection(ctx, &db);
    if (!err.ok()) { return err; }

    Transaction<DbType> tx(*db);
    err = tx.Begin(ctx);
    if (err.ok()) { err = ExecuteBatch<Backend>(*db, rendered, mode, ctx); }
    if (err.ok()) { err = tx.Commit(ctx); }
    if (!err.ok()) {
      Error rolled_back = tx.Rollback();
      if (!rolled_back.ok()) {
        Logger::Get()->error("{}", rolled_back.message);
      }
    }
    return err;
  }

  mutable std::mutex mutex_;
  ConnectionProducer<Backend> producer_;
  CredentialsProducer credentials_;
};

}  // namespace sqlcred
