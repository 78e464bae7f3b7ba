#include "tally/csv.hpp"

#include "tally/config.hpp"
#include "tally/file.hpp"

namespace tally {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view s) {
  const auto b = s.find_first_not_of(kWhitespace);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(kWhitespace);
  return s.substr(b, e - b + 1);
}

}  // namespace

std::vector<std::string> split_values(std::string_view csv) {
  std::vector<std::string> out;
  for_each_value(csv, [&](const std::string& v) {
    out.push_back(v);
    return true;
  });
  return out;
}

std::size_t for_each_value(std::string_view csv, const std::function<bool(const std::string&)>& fn) {
  std::size_t visited = 0;
  std::size_t start = 0;
  while (start <= csv.size()) {
    auto end = csv.find(',', start);
    if (end == std::string_view::npos) end = csv.size();
    const auto value = trim(csv.substr(start, end - start));
    if (!value.empty()) {
      ++visited;
      if (!fn(std::string(value))) break;
    }
    start = end + 1;
  }
  return visited;
}

std::optional<std::string> merge_files(std::string_view csv, Error* err) {
  const Config cfg = global_config();
  const uint64_t cap = cfg.max_file_bytes;
  std::string merged;
  bool ok = true;

  for_each_value(csv, [&](const std::string& path) {
    const uint64_t remaining = cap - merged.size();
    ok = for_each_chunk(path, remaining, cfg.decompress,
                        [&](std::string_view chunk) {
                          merged.append(chunk.data(), chunk.size());
                          return true;
                        },
                        err);
    return ok;
  });

  if (!ok) return std::nullopt;
  return merged;
}

}  // namespace tally
