// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + engine error number + fixed-size message buffer
//   - Compatible with -fno-exceptions
//   - native_code keeps the engine-reported number (e.g. MySQL 1295) so
//     backend predicates can classify failures without parsing messages

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace sqlcred {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kNullParam = -3,
  kMisuse = -4,
  kRange = -5,
  kConfiguration = -6,
  kEmptyStatement = -7,
  kGeneration = -8,
  kStatement = -9,
  kTransaction = -10,
  kConnection = -11,
  kCancelled = -12,
  kNotInitialized = -13,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:             return "ok";
    case ErrorCode::kError:          return "error";
    case ErrorCode::kNotOpen:        return "not_open";
    case ErrorCode::kNullParam:      return "null_param";
    case ErrorCode::kMisuse:         return "misuse";
    case ErrorCode::kRange:          return "range";
    case ErrorCode::kConfiguration:  return "configuration";
    case ErrorCode::kEmptyStatement: return "empty_statement";
    case ErrorCode::kGeneration:     return "generation";
    case ErrorCode::kStatement:      return "statement";
    case ErrorCode::kTransaction:    return "transaction";
    case ErrorCode::kConnection:     return "connection";
    case ErrorCode::kCancelled:      return "cancelled";
    case ErrorCode::kNotInitialized: return "not_initialized";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  int32_t native_code = 0;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    native_code = 0;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  /// Set with the engine's own error number attached.
  void SetNative(ErrorCode c, int32_t native, const char* msg) {
    Set(c, msg);
    native_code = native;
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    native_code = 0;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    native_code = 0;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error MakeNative(ErrorCode c, int32_t native, const char* msg) {
    Error e;
    e.SetNative(c, native, msg);
    return e;
  }

  /// Re-tag an error under a new code, prefixing its message.
  /// Keeps native_code so the engine error stays inspectable.
  static Error Wrap(ErrorCode c, const char* prefix, const Error& inner) {
    Error e;
    e.SetFormat(c, "%s: %s", prefix != nullptr ? prefix : "", inner.message);
    e.native_code = inner.native_code;
    return e;
  }
};

}  // namespace sqlcred
