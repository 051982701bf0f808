// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::ConnectionProducer<Backend> -- owns the typed connection config
// and the single live connection to one database target.
//
// Design:
//   - Thin template over Backend::Db, no virtual dispatch
//   - Lazily opens on first Connection(); an open handle is reused while it
//     still pings and is younger than max_connection_lifetime
//   - The URL is rendered with the current username/password on every open
//   - A handle whose close failed is replaced on the next Connection()
//   - Not synchronized: always driven under CredentialManager's guard
//
// Usage:
//   sqlcred::ConnectionProducer<sqlcred::Sqlite3Backend> producer;
//   producer.Initialize({{"connection_url", ":memory:"}}, true);
//   sqlcred::Sqlite3Db* db = nullptr;
//   producer.Connection(sqlcred::Context::Background(), &db);

#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "sqlcred/connection_config.hpp"
#include "sqlcred/context.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/logger.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// ConnectionProducer<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class ConnectionProducer {
 public:
  using DbType = typename Backend::Db;
  using Clock = std::chrono::steady_clock;

  ConnectionProducer() = default;
  ~ConnectionProducer() = default;

  // No copy, no move: callers hold DbType* into this object.
  ConnectionProducer(const ConnectionProducer&) = delete;
  ConnectionProducer& operator=(const ConnectionProducer&) = delete;

  // --- Setup ---

  /// Validate and store the config. With verify_connection, also connect
  /// and ping so a bad config is reported now rather than on first use.
  Error Initialize(const Settings& settings, bool verify_connection,
                   const Context& ctx = Context::Background()) {
    ConnectionConfig cfg;
    Error err = ConnectionConfig::FromSettings(settings, &cfg);
    if (!err.ok()) { return err; }

    err = Close();
    if (!err.ok()) { return err; }

    config_ = std::move(cfg);
    initialized_ = true;

    if (verify_connection) {
      DbType* db = nullptr;
      err = Connection(ctx, &db);
      if (err.ok()) { err = db->Ping(); }
      if (!err.ok()) {
        return Error::Wrap(ErrorCode::kConnection,
                           "error verifying connection", err);
      }
    }
    return Error::Ok();
  }

  bool Initialized() const { return initialized_; }

  // --- Connection ---

  Error Connection(const Context& ctx, DbType** out_db) {
    if (out_db == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out_db is null");
    }
    if (!initialized_) {
      return Error::Make(ErrorCode::kNotInitialized,
                         "connection producer not initialized");
    }
    Error err = ctx.Check();
    if (!err.ok()) { return err; }

    if (db_.IsOpen()) {
      if (!must_reopen_ && !Expired()) {
        Error ping = db_.Ping();
        if (ping.ok()) {
          *out_db = &db_;
          return Error::Ok();
        }
        Logger::Get()->warn("connection ping failed, reconnecting: {}",
                            ping.message);
      }
      // Reestablishing anyway; a close failure here only matters for logs.
      Error closed = db_.Close();
      if (!closed.ok()) {
        Logger::Get()->warn("closing stale connection failed: {}",
                            closed.message);
      }
    }

    std::string url = config_.RenderConnectionUrl();
    err = db_.Open(url.c_str());
    if (!err.ok()) {
      return Error::Wrap(ErrorCode::kConnection, "open connection", err);
    }
    opened_at_ = Clock::now();
    must_reopen_ = false;
    *out_db = &db_;
    return Error::Ok();
  }

  /// A handle that failed to close is never reused; the next
  /// Connection() retries the close and opens a fresh one.
  Error Close() {
    if (!db_.IsOpen()) { return Error::Ok(); }
    Error err = db_.Close();
    if (!err.ok()) {
      must_reopen_ = true;
      return Error::Wrap(ErrorCode::kConnection, "close connection", err);
    }
    return Error::Ok();
  }

  bool IsOpen() const { return db_.IsOpen(); }

  // --- Config ---

  const ConnectionConfig& Config() const { return config_; }

  void UpdatePassword(const std::string& password) {
    config_.password = password;
  }

 private:
  bool Expired() const {
    if (config_.max_connection_lifetime_s <= 0) { return false; }
    return Clock::now() - opened_at_ >=
           std::chrono::seconds(config_.max_connection_lifetime_s);
  }

  ConnectionConfig config_;
  DbType db_;
  bool initialized_ = false;
  bool must_reopen_ = false;
  Clock::time_point opened_at_{};
};

}  // namespace sqlcred
