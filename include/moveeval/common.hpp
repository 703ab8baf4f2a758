#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace moveeval {

namespace fs = std::filesystem;

using KeyValueLines = std::vector<std::pair<std::string, std::string>>;

inline std::string trim(std::string s) {
  auto issp = [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && issp(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && issp(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

// Whole-string decimal integer; nullopt on anything else.
std::optional<long long> parse_integer(const std::string& s);

// parse_integer narrowed to int; out-of-range values are rejected, not wrapped.
std::optional<int> parse_int(const std::string& s);

// "key=value" lines in file order. Lines without '=' are ignored. nullopt if unreadable.
std::optional<KeyValueLines> read_key_values(const fs::path& path);

// Writes "key=value" lines through a temp file + rename so readers never see half a file.
void write_key_values(const fs::path& path, const KeyValueLines& lines);

// "shard-007.ndjson" style zero-padded index.
std::string padded_index(std::size_t index, int width = 3);

// ISO-8601 UTC timestamp with microseconds, e.g. 2024-05-01T12:00:00.000000+00:00.
std::string utc_timestamp_now();

}  // namespace moveeval
