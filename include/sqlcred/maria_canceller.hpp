// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::MariaCanceller -- aborts the statement running on one MySQL
// session when a Context is cancelled or its deadline passes.
//
// Design:
//   - The client library blocks inside mysql_query()/mysql_stmt_execute(),
//     so the context is polled on a helper thread
//   - Once Check() fails the helper opens a side connection with the same
//     credentials and issues KILL QUERY <thread id>; the blocked call then
//     returns ER_QUERY_INTERRUPTED and the caller rolls back
//   - Fires at most once; the destructor stops and joins the helper, so no
//     KILL can arrive after the watched scope ends

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <thread>

#include <mysql.h>

#include "sqlcred/context.hpp"
#include "sqlcred/logger.hpp"
#include "sqlcred/maria_dsn.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// MariaCanceller
// ---------------------------------------------------------------------------

class MariaCanceller {
 public:
  MariaCanceller(const MariaDsn& dsn, unsigned long thread_id,
                 const Context& ctx)
      : dsn_(dsn), thread_id_(thread_id), ctx_(ctx), worker_([this] { Run(); }) {}

  ~MariaCanceller() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stop_ = true;
    }
    cv_.notify_one();
    worker_.join();
  }

  // Owns a running thread bound to this: no copy, no move.
  MariaCanceller(const MariaCanceller&) = delete;
  MariaCanceller& operator=(const MariaCanceller&) = delete;

  bool Fired() const { return fired_.load(std::memory_order_acquire); }

 private:
  static constexpr std::chrono::milliseconds kPollInterval{20};
  static constexpr unsigned int kConnectTimeoutS = 5;

  void Run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_) {
      if (!ctx_.Check().ok()) {
        lock.unlock();
        Kill();
        return;
      }
      cv_.wait_for(lock, kPollInterval);
    }
  }

  void Kill() {
    mysql_thread_init();
    MYSQL* conn = mysql_init(nullptr);
    if (conn == nullptr) {
      Logger::Get()->error("cancel: mysql_init failed");
      mysql_thread_end();
      return;
    }
    unsigned int timeout = kConnectTimeoutS;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    const char* password = dsn_.password.empty() ? nullptr : dsn_.password.c_str();
    const char* database = dsn_.database.empty() ? nullptr : dsn_.database.c_str();
    if (mysql_real_connect(conn, dsn_.host.c_str(), dsn_.user.c_str(), password,
                           database, dsn_.port, nullptr, 0) == nullptr) {
      Logger::Get()->error("cancel: side connection failed ({}): {}",
                           mysql_errno(conn), mysql_error(conn));
    } else {
      char sql[48];
      std::snprintf(sql, sizeof(sql), "KILL QUERY %lu", thread_id_);
      if (mysql_query(conn, sql) != 0) {
        Logger::Get()->error("cancel: {} failed ({}): {}", sql,
                             mysql_errno(conn), mysql_error(conn));
      } else {
        fired_.store(true, std::memory_order_release);
        Logger::Get()->debug("cancel: killed query on session {}", thread_id_);
      }
    }
    mysql_close(conn);
    mysql_thread_end();
  }

  MariaDsn dsn_;
  unsigned long thread_id_;
  const Context& ctx_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::atomic<bool> fired_{false};
  std::thread worker_;  // last: starts after every other member exists
};

}  // namespace sqlcred
