#include "tally/config.hpp"

#include <cstdlib>
#include <mutex>

#include "tally/jsonlite.hpp"

namespace tally {
namespace {

std::mutex g_config_mu;
std::optional<Config> g_config;

std::optional<uint64_t> parse_u64(const char* text) {
  if (!text || !text[0]) return std::nullopt;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (end == text || *end != '\0' || text[0] == '-') return std::nullopt;
  return static_cast<uint64_t>(v);
}

std::optional<bool> parse_flag(const char* text) {
  if (!text) return std::nullopt;
  const std::string s(text);
  if (s == "1" || s == "true" || s == "on") return true;
  if (s == "0" || s == "false" || s == "off") return false;
  return std::nullopt;
}

}  // namespace

Config load_config_from_env() {
  Config cfg;
  if (const char* e = std::getenv("TALLY_EVENT_LOG")) cfg.event_log_path = e;
  if (auto v = parse_u64(std::getenv("TALLY_MAX_FILE_BYTES"))) cfg.max_file_bytes = *v;
  if (auto v = parse_flag(std::getenv("TALLY_DIGEST"))) cfg.digest = *v;
  if (auto v = parse_flag(std::getenv("TALLY_DECOMPRESS"))) cfg.decompress = *v;
  return cfg;
}

std::optional<Config> parse_config_json(const std::string& json, const Config& base, Error* err) {
  Config cfg = base;

  if (jsonlite::has_key(json, "event_log_path")) {
    cfg.event_log_path = jsonlite::get_string(json, "event_log_path", cfg.event_log_path);
  }
  if (jsonlite::has_key(json, "max_file_bytes")) {
    auto v = jsonlite::get_u64(json, "max_file_bytes");
    if (!v) return fail(err, ErrorCode::invalid_argument, "max_file_bytes must be an unsigned integer");
    cfg.max_file_bytes = *v;
  }
  if (jsonlite::has_key(json, "digest")) {
    auto v = jsonlite::get_bool(json, "digest");
    if (!v) return fail(err, ErrorCode::invalid_argument, "digest must be true or false");
    cfg.digest = *v;
  }
  if (jsonlite::has_key(json, "decompress")) {
    auto v = jsonlite::get_bool(json, "decompress");
    if (!v) return fail(err, ErrorCode::invalid_argument, "decompress must be true or false");
    cfg.decompress = *v;
  }
  return cfg;
}

Config global_config() {
  std::lock_guard<std::mutex> lk(g_config_mu);
  if (!g_config) g_config = load_config_from_env();
  return *g_config;
}

void set_global_config(const Config& config) {
  std::lock_guard<std::mutex> lk(g_config_mu);
  g_config = config;
}

}  // namespace tally
