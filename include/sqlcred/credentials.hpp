// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::CredentialsProducer -- usernames, passwords and expiration
// literals for dynamically created database accounts.
//
// Design:
//   - Length profile is an immutable UsernamePolicy value chosen at
//     construction; two named profiles are provided
//   - Randomness from OpenSSL RAND_bytes with rejection sampling, so every
//     alphanumeric character is equally likely
//   - Stateless apart from the policy: safe to call from any thread
//
// Username layout (before truncation to username_len):
//   v<sep><display_name><sep><role_name><sep><20 random chars><sep><unix secs>
// where an empty or excluded (kNoneLength) segment is left out together
// with its separator.

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <utility>

#include <openssl/rand.h>

#include "sqlcred/error.hpp"

namespace sqlcred {

/// Segment budget that drops the segment entirely.
constexpr int32_t kNoneLength = -1;

struct UsernamePolicy {
  int32_t display_name_len;
  int32_t role_name_len;
  int32_t username_len;
  char separator;
};

constexpr UsernamePolicy kCurrentUsernamePolicy{10, 10, 32, '-'};
constexpr UsernamePolicy kLegacyUsernamePolicy{kNoneLength, 4, 16, '-'};

/// Per-request naming input.
struct UsernameConfig {
  std::string display_name;
  std::string role_name;
};

// ---------------------------------------------------------------------------
// Random strings
// ---------------------------------------------------------------------------

namespace detail {

constexpr char kAlphaNumeric[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr uint32_t kAlphaNumericLen = sizeof(kAlphaNumeric) - 1;
// Largest multiple of 62 that fits a byte; bytes at or above are rerolled.
constexpr uint32_t kRejectFrom = 256 - (256 % kAlphaNumericLen);

// Prefix that satisfies upper/lower/digit/symbol complexity rules.
constexpr char kPasswordPrefix[] = "A1a-";
constexpr int32_t kPasswordLen = 20;
constexpr int32_t kUsernameRandomLen = 20;

}  // namespace detail

/// Append `count` uniformly random alphanumeric characters to *out.
inline Error AppendRandomAlphaNumeric(int32_t count, std::string* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  if (count < 0) {
    return Error::Make(ErrorCode::kGeneration, "negative random length");
  }

  unsigned char buf[64];
  int32_t remaining = count;
  while (remaining > 0) {
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
      return Error::Make(ErrorCode::kGeneration,
                         "random source unavailable");
    }
    for (uint32_t i = 0; i < sizeof(buf) && remaining > 0; ++i) {
      if (buf[i] >= detail::kRejectFrom) { continue; }
      out->push_back(detail::kAlphaNumeric[buf[i] % detail::kAlphaNumericLen]);
      --remaining;
    }
  }
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// CredentialsProducer
// ---------------------------------------------------------------------------

class CredentialsProducer {
 public:
  explicit CredentialsProducer(const UsernamePolicy& policy) : policy_(policy) {}

  const UsernamePolicy& Policy() const { return policy_; }

  Error GenerateUsername(const UsernameConfig& config,
                         std::string* out_username) const {
    if (out_username == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out_username is null");
    }
    Error err = ValidatePolicy();
    if (!err.ok()) { return err; }

    std::string username = "v";
    AppendSegment(config.display_name, policy_.display_name_len, &username);
    AppendSegment(config.role_name, policy_.role_name_len, &username);

    username.push_back(policy_.separator);
    err = AppendRandomAlphaNumeric(detail::kUsernameRandomLen, &username);
    if (!err.ok()) { return err; }

    username.push_back(policy_.separator);
    username += std::to_string(static_cast<int64_t>(std::time(nullptr)));

    if (username.size() > static_cast<size_t>(policy_.username_len)) {
      username.resize(static_cast<size_t>(policy_.username_len));
    }
    *out_username = std::move(username);
    return Error::Ok();
  }

  /// 20 characters: fixed complexity prefix plus random alphanumerics.
  Error GeneratePassword(std::string* out_password) const {
    if (out_password == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out_password is null");
    }
    std::string password = detail::kPasswordPrefix;
    Error err = AppendRandomAlphaNumeric(
        detail::kPasswordLen - static_cast<int32_t>(password.size()),
        &password);
    if (!err.ok()) { return err; }
    *out_password = std::move(password);
    return Error::Ok();
  }

  /// UTC literal "YYYY-MM-DD HH:MM:SS+0000".
  Error GenerateExpiration(std::chrono::system_clock::time_point expiration,
                           std::string* out_expiration) const {
    if (out_expiration == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out_expiration is null");
    }
    std::time_t t = std::chrono::system_clock::to_time_t(expiration);
    std::tm tm_utc{};
    if (gmtime_r(&t, &tm_utc) == nullptr) {
      return Error::Make(ErrorCode::kGeneration,
                         "expiration out of representable range");
    }
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S+0000",
                      &tm_utc) == 0) {
      return Error::Make(ErrorCode::kGeneration,
                         "expiration could not be formatted");
    }
    *out_expiration = buf;
    return Error::Ok();
  }

 private:
  Error ValidatePolicy() const {
    if (policy_.username_len < 1) {
      Error err;
      err.SetFormat(ErrorCode::kGeneration,
                    "username length budget must be positive, got %d",
                    policy_.username_len);
      return err;
    }
    if (!ValidSegmentBudget(policy_.display_name_len) ||
        !ValidSegmentBudget(policy_.role_name_len)) {
      return Error::Make(ErrorCode::kGeneration,
                         "name segment budget must be positive or none");
    }
    return Error::Ok();
  }

  static bool ValidSegmentBudget(int32_t len) {
    return len == kNoneLength || len > 0;
  }

  void AppendSegment(const std::string& value, int32_t budget,
                     std::string* username) const {
    if (budget == kNoneLength || value.empty()) { return; }
    username->push_back(policy_.separator);
    username->append(value, 0, static_cast<size_t>(budget));
  }

  UsernamePolicy policy_;
};

}  // namespace sqlcred
