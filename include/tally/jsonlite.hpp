#pragma once

// tally/jsonlite.hpp — Minimal JSON helpers for flat configuration objects
// and for emitting JSON lines. Not a general parser: lookups match a key
// anywhere in the text and expect a scalar value.

#include <cstdio>
#include <optional>
#include <regex>
#include <string>

namespace tally::jsonlite {

inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i=0;i<in.size();++i) {
    if (in[i]=='\\' && i+1<in.size()) {
      char n=in[++i];
      if (n=='n') o += '\n';
      else if (n=='t') o += '\t';
      else if (n=='r') o += '\r';
      else o += n;
    } else o += in[i];
  }
  return o;
}

inline bool has_key(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:");
  return std::regex_search(s, re);
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

// Unset when the key is absent or its value is not true/false.
inline std::optional<bool> get_bool(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return std::nullopt;
}

// Unset when the key is absent or its value is not an unsigned integer.
inline std::optional<unsigned long long> get_u64(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]{1,19})\\s*[,}]");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoull(m[1].str());
  return std::nullopt;
}

inline std::string escape(const std::string& s) {
  std::string o;
  for (char c : s) {
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\r') o += "\\r";
    else if (c == '\t') o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      o += buf;
    }
    else o += c;
  }
  return o;
}

}  // namespace tally::jsonlite
