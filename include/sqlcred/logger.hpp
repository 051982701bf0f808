// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Logger -- thin wrapper over spdlog.
//
// Design:
//   - One named logger ("sqlcred") on a colored stdout sink
//   - Created on first use; level taken from SQLCRED_LOG_LEVEL (default info)
//   - Reuses a logger of the same name if the host already registered one
//
// Usage:
//   sqlcred::Logger::Init("debug");
//   sqlcred::Logger::Get()->info("revoked user {}", username);

#pragma once

#include <cstdlib>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sqlcred {

class Logger {
 public:
  static constexpr const char* kName = "sqlcred";
  static constexpr const char* kLevelEnv = "SQLCRED_LOG_LEVEL";

  /// Change the level at runtime.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void Init(const char* level) {
    Get()->set_level(spdlog::level::from_str(level));
  }

  /// Always returns a valid logger.
  static std::shared_ptr<spdlog::logger> Get() {
    static std::shared_ptr<spdlog::logger> logger = Create();
    return logger;
  }

 private:
  static std::shared_ptr<spdlog::logger> Create() {
    std::shared_ptr<spdlog::logger> logger = spdlog::get(kName);
    if (logger != nullptr) { return logger; }

    logger = spdlog::stdout_color_mt(kName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

    const char* level = std::getenv(kLevelEnv);
    logger->set_level(spdlog::level::from_str(
        (level != nullptr && level[0] != '\0') ? level : "info"));
    return logger;
  }
};

}  // namespace sqlcred
