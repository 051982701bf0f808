// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred statement templates -- split a raw statement batch and fill in
// {{placeholder}} tokens.
//
// Design:
//   - Plain text substitution, no SQL escaping: templates are trusted
//     administrator input
//   - Single left-to-right scan; substituted values are never rescanned, so
//     the output does not depend on context iteration order
//   - Unknown or unterminated placeholders are copied literally
//   - Pure functions, no shared state

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace sqlcred {

using TemplateContext = std::map<std::string, std::string>;

namespace detail {

inline bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

inline std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && IsSpace(s[begin])) { ++begin; }
  while (end > begin && IsSpace(s[end - 1])) { --end; }
  return s.substr(begin, end - begin);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// Split / render
// ---------------------------------------------------------------------------

/// Split on ';', trim each piece and drop the empty ones.
inline std::vector<std::string> SplitStatements(const std::string& raw) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= raw.size()) {
    size_t pos = raw.find(';', start);
    if (pos == std::string::npos) { pos = raw.size(); }
    std::string piece = detail::Trim(raw.substr(start, pos - start));
    if (!piece.empty()) {
      out.push_back(piece);
    }
    start = pos + 1;
  }
  return out;
}

/// Replace every {{key}} whose key is in ctx.
inline std::string RenderTemplate(const std::string& sql,
                                  const TemplateContext& ctx) {
  std::string out;
  out.reserve(sql.size());
  size_t pos = 0;
  while (pos < sql.size()) {
    size_t open = sql.find("{{", pos);
    if (open == std::string::npos) {
      out.append(sql, pos, std::string::npos);
      break;
    }
    size_t close = sql.find("}}", open + 2);
    if (close == std::string::npos) {
      out.append(sql, pos, std::string::npos);
      break;
    }
    out.append(sql, pos, open - pos);
    auto it = ctx.find(sql.substr(open + 2, close - open - 2));
    if (it != ctx.end()) {
      out += it->second;
      pos = close + 2;
    } else {
      // Keep the "{{" and rescan after it; a later "{{" may still match.
      out.append("{{");
      pos = open + 2;
    }
  }
  return out;
}

inline std::vector<std::string> RenderStatement(const std::string& raw,
                                                const TemplateContext& ctx) {
  std::vector<std::string> out = SplitStatements(raw);
  for (auto& stmt : out) {
    stmt = RenderTemplate(stmt, ctx);
  }
  return out;
}

/// Render every raw statement of a batch, preserving batch order and
/// within-statement order.
inline std::vector<std::string> RenderBatch(
    const std::vector<std::string>& batch, const TemplateContext& ctx) {
  std::vector<std::string> out;
  for (const auto& raw : batch) {
    std::vector<std::string> rendered = RenderStatement(raw, ctx);
    out.insert(out.end(), rendered.begin(), rendered.end());
  }
  return out;
}

}  // namespace sqlcred
