// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::ConnectionConfig -- typed connection settings.
//
// Design:
//   - Populated field by field from the generic Settings map handed over by
//     the plugin host; each field is validated on extraction
//   - Unknown keys are ignored but kept, so ToSettings() returns the same
//     shape it was given with the known fields overwritten
//   - connection_url may contain {{username}} / {{password}}; it is rendered
//     on every open so a rotated password takes effect on reconnect
//   - For MySQL the rendered URL is a ':'-separated MariaDsn, so username
//     and password must not contain ':' or the open is rejected.
//     Generated passwords never contain it.
//
// Recognized keys:
//   connection_url           required, non-empty
//   username, password       optional
//   max_connection_lifetime  optional, "90", "90s", "5m", "1h"; 0 = unlimited,
//                            at most kMaxDurationSeconds

#pragma once

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>

#include "sqlcred/error.hpp"
#include "sqlcred/statement_template.hpp"

namespace sqlcred {

using Settings = std::map<std::string, std::string>;

/// Longest duration that still fits the steady clock's tick type.
constexpr int64_t kMaxDurationSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::duration::max())
        .count();

/// Parse a duration in seconds: a bare integer, or an integer followed by
/// one of s, m, h.
inline Error ParseDurationSeconds(const std::string& raw, int64_t* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  std::string text = detail::Trim(raw);
  if (text.empty()) {
    return Error::Make(ErrorCode::kConfiguration, "empty duration");
  }

  int64_t scale = 1;
  char unit = text.back();
  if (unit == 's' || unit == 'm' || unit == 'h') {
    scale = (unit == 'h') ? 3600 : (unit == 'm') ? 60 : 1;
    text.pop_back();
  }
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    Error err;
    err.SetFormat(ErrorCode::kConfiguration, "invalid duration \"%s\"",
                  raw.c_str());
    return err;
  }

  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' ||
      value > kMaxDurationSeconds / scale) {
    Error err;
    err.SetFormat(ErrorCode::kConfiguration, "invalid duration \"%s\"",
                  raw.c_str());
    return err;
  }
  *out = static_cast<int64_t>(value) * scale;
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// ConnectionConfig
// ---------------------------------------------------------------------------

struct ConnectionConfig {
  static constexpr const char* kConnectionUrl = "connection_url";
  static constexpr const char* kUsername = "username";
  static constexpr const char* kPassword = "password";
  static constexpr const char* kMaxConnectionLifetime =
      "max_connection_lifetime";

  std::string connection_url;
  std::string username;
  std::string password;
  int64_t max_connection_lifetime_s = 0;

  /// Everything the host passed in, recognized or not.
  Settings raw;

  static Error FromSettings(const Settings& settings, ConnectionConfig* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }

    ConnectionConfig cfg;
    cfg.raw = settings;

    auto url = settings.find(kConnectionUrl);
    if (url == settings.end() || detail::Trim(url->second).empty()) {
      return Error::Make(ErrorCode::kConfiguration,
                         "connection_url cannot be empty");
    }
    cfg.connection_url = url->second;

    auto user = settings.find(kUsername);
    if (user != settings.end()) { cfg.username = user->second; }

    auto pass = settings.find(kPassword);
    if (pass != settings.end()) { cfg.password = pass->second; }

    auto lifetime = settings.find(kMaxConnectionLifetime);
    if (lifetime != settings.end()) {
      Error err = ParseDurationSeconds(lifetime->second,
                                       &cfg.max_connection_lifetime_s);
      if (!err.ok()) {
        return Error::Wrap(ErrorCode::kConfiguration,
                           "max_connection_lifetime", err);
      }
    }

    *out = std::move(cfg);
    return Error::Ok();
  }

  Settings ToSettings() const {
    Settings out = raw;
    out[kConnectionUrl] = connection_url;
    out[kUsername] = username;
    out[kPassword] = password;
    out[kMaxConnectionLifetime] =
        std::to_string(max_connection_lifetime_s) + "s";
    return out;
  }

  /// Rotation needs an existing account to rotate.
  bool HasRootCredentials() const {
    return !username.empty() && !password.empty();
  }

  std::string RenderConnectionUrl() const {
    return RenderTemplate(connection_url, {{kUsername, username},
                                           {kPassword, password}});
  }
};

}  // namespace sqlcred
