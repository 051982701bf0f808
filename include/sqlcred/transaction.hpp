// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Transaction / ExecuteBatch -- run rendered statements inside one
// database transaction.
//
// Design:
//   - Transaction<Db> is an RAII guard: an active transaction is rolled
//     back when the guard goes out of scope, so no exit path commits a
//     partial batch
//   - ExecuteBatch<Backend> is engine-agnostic; the only engine knowledge
//     it needs is Backend::IsUnsupportedPreparedStatement()
//   - The context is checked before every database call, and the
//     connection watches it while a statement runs (Db::WatchContext) so
//     a cancel or deadline aborts the statement in flight
//
// Modes:
//   kPreparedWithFallback  prepare each statement; when the engine says the
//                          command is not supported by the prepared
//                          protocol, execute the same text directly
//   kDirectOnly            never prepare (REVOKE / DROP USER / ALTER USER)

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sqlcred/context.hpp"
#include "sqlcred/error.hpp"
#include "sqlcred/logger.hpp"

namespace sqlcred {

enum class ExecMode : uint8_t {
  kPreparedWithFallback,
  kDirectOnly,
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

template <typename Db>
class Transaction {
 public:
  explicit Transaction(Db& db) : db_(db) {}

  ~Transaction() {
    Error err = Rollback();
    if (!err.ok()) {
      Logger::Get()->error("rollback on scope exit failed: {}", err.message);
    }
  }

  // No copy, no move: the guard is bound to one scope.
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Error Begin(const Context& ctx) {
    if (active_) {
      return Error::Make(ErrorCode::kMisuse, "transaction already active");
    }
    Error err = ctx.Check();
    if (!err.ok()) { return err; }

    err = db_.BeginTransaction();
    if (!err.ok()) {
      return Error::Wrap(ErrorCode::kTransaction, "begin transaction", err);
    }
    active_ = true;
    return Error::Ok();
  }

  /// On failure the transaction stays active and is rolled back by
  /// Rollback() or the destructor.
  Error Commit(const Context& ctx) {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "no active transaction");
    }
    Error err = ctx.Check();
    if (!err.ok()) { return err; }

    err = db_.Commit();
    if (!err.ok()) {
      return Error::Wrap(ErrorCode::kTransaction, "commit", err);
    }
    active_ = false;
    return Error::Ok();
  }

  /// Idempotent; a no-op once committed or rolled back. Not subject to
  /// cancellation: aborting must always be attempted.
  Error Rollback() {
    if (!active_) { return Error::Ok(); }
    active_ = false;
    Error err = db_.Rollback();
    if (!err.ok()) {
      return Error::Wrap(ErrorCode::kTransaction, "rollback", err);
    }
    return Error::Ok();
  }

  bool Active() const { return active_; }

 private:
  Db& db_;
  bool active_ = false;
};

// ---------------------------------------------------------------------------
// ContextWatch
// ---------------------------------------------------------------------------

/// Scoped Db::WatchContext(&ctx) ... Db::WatchContext(nullptr).
template <typename Db>
class ContextWatch {
 public:
  ContextWatch(Db& db, const Context& ctx) : db_(db) {
    db_.WatchContext(&ctx);
  }

  ~ContextWatch() { db_.WatchContext(nullptr); }

  ContextWatch(const ContextWatch&) = delete;
  ContextWatch& operator=(const ContextWatch&) = delete;

 private:
  Db& db_;
};

// ---------------------------------------------------------------------------
// ExecuteBatch
// ---------------------------------------------------------------------------

namespace detail {

/// A statement aborted by the watched context reports the cancellation
/// rather than the engine's interrupt error.
inline Error StatementFailure(const Context& ctx, const Error& err) {
  Error cancelled = ctx.Check();
  return cancelled.ok() ? err : cancelled;
}

}  // namespace detail

/// Execute statements in order on a connection that already has an open
/// transaction. Stops at the first failure; the caller rolls back.
template <typename Backend>
Error ExecuteBatch(typename Backend::Db& db,
                   const std::vector<std::string>& statements,
                   ExecMode mode, const Context& ctx) {
  ContextWatch<typename Backend::Db> watch(db, ctx);

  for (size_t i = 0; i < statements.size(); ++i) {
    Error err = ctx.Check();
    if (!err.ok()) { return err; }

    const char* sql = statements[i].c_str();

    if (mode == ExecMode::kDirectOnly) {
      db.ExecDml(sql, &err);
      if (!err.ok()) {
        Logger::Get()->warn("statement {} of {} failed: {}", i + 1,
                            statements.size(), err.message);
        return detail::StatementFailure(ctx, err);
      }
      continue;
    }

    typename Backend::Statement stmt = db.CompileStatement(sql, &err);
    if (!err.ok()) {
      if (!Backend::IsUnsupportedPreparedStatement(err)) {
        Logger::Get()->warn("statement {} of {} failed to prepare: {}", i + 1,
                            statements.size(), err.message);
        return detail::StatementFailure(ctx, err);
      }
      Logger::Get()->debug(
          "statement {} of {} not supported by prepared protocol, "
          "executing directly", i + 1, statements.size());

      err = ctx.Check();
      if (!err.ok()) { return err; }
      db.ExecDml(sql, &err);
      if (!err.ok()) {
        Logger::Get()->warn("statement {} of {} failed: {}", i + 1,
                            statements.size(), err.message);
        return detail::StatementFailure(ctx, err);
      }
      continue;
    }

    stmt.ExecDml(&err);
    if (!err.ok()) {
      Logger::Get()->warn("statement {} of {} failed: {}", i + 1,
                          statements.size(), err.message);
      return detail::StatementFailure(ctx, err);
    }
  }
  return Error::Ok();
}

}  // namespace sqlcred
