// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::MariaDsn -- connection parameters for MariaDB/MySQL.
//
// Format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:mysql"
//   or   "127.0.0.1:3306:root::mysql" (empty password)
//
// Fields can be empty and trailing fields can be omitted. ':' separates
// fields and cannot appear inside one, so a DSN with more than five
// fields is rejected instead of being split at the wrong place.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#include "sqlcred/error.hpp"

namespace sqlcred {

struct MariaDsn {
  std::string host = "localhost";
  uint16_t port = 3306;
  std::string user = "root";
  std::string password;  // empty: no password
  std::string database;  // empty: no default schema

  static constexpr int32_t kFieldCount = 5;

  static Error Parse(const char* dsn, MariaDsn* out) {
    if (dsn == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }

    std::string fields[kFieldCount];
    int32_t count = 1;
    for (const char* p = dsn; *p != '\0'; ++p) {
      if (*p != ':') {
        fields[count - 1].push_back(*p);
        continue;
      }
      if (count == kFieldCount) {
        return Error::Make(ErrorCode::kConfiguration,
                           "dsn has more than 5 ':'-separated fields");
      }
      ++count;
    }

    MariaDsn parsed;
    if (!fields[0].empty()) { parsed.host = fields[0]; }
    if (!fields[1].empty()) {
      char* end = nullptr;
      errno = 0;
      unsigned long port = std::strtoul(fields[1].c_str(), &end, 10);
      if (errno != 0 || *end != '\0' || port == 0 || port > 65535) {
        Error err;
        err.SetFormat(ErrorCode::kConfiguration, "invalid port \"%s\"",
                      fields[1].c_str());
        return err;
      }
      parsed.port = static_cast<uint16_t>(port);
    }
    if (!fields[2].empty()) { parsed.user = fields[2]; }
    parsed.password = fields[3];
    parsed.database = fields[4];

    *out = std::move(parsed);
    return Error::Ok();
  }
};

}  // namespace sqlcred
