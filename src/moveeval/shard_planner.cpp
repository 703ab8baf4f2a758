#include "moveeval/shard_planner.hpp"

#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include "moveeval/common.hpp"
#include "moveeval/errors.hpp"
#include "moveeval/record_io.hpp"

namespace moveeval {

fs::path manifest_path(const fs::path& shardDir) { return shardDir / "manifest.txt"; }

fs::path shard_path(const fs::path& shardDir, std::size_t index) {
  return shardDir / ("shard-" + padded_index(index) + ".ndjson");
}

std::optional<ShardManifest> load_manifest(const fs::path& path) {
  const auto lines = read_key_values(path);
  if (!lines) return std::nullopt;

  ShardManifest m;
  std::optional<std::string> input, outputDir, workers, total, maxGames;
  for (const auto& [key, value] : *lines) {
    if (key == "shard_path") {
      if (!value.empty()) m.shardPaths.emplace_back(value);
    } else if (key == "input_path") {
      input = value;
    } else if (key == "output_dir") {
      outputDir = value;
    } else if (key == "workers") {
      workers = value;
    } else if (key == "total_lines") {
      total = value;
    } else if (key == "max_games") {
      maxGames = value;
    }
  }
  if (!input || input->empty() || !outputDir || outputDir->empty() || !workers || !total)
    return std::nullopt;

  const auto w = parse_int(*workers);
  const auto t = parse_integer(*total);
  if (!w || !t || *w < 1 || *t < 0) return std::nullopt;

  if (maxGames && !maxGames->empty()) {
    const auto cap = parse_int(*maxGames);
    if (!cap) return std::nullopt;
    m.maxGames = *cap;
  }
  if (m.shardPaths.empty()) return std::nullopt;

  m.inputPath = *input;
  m.outputDir = *outputDir;
  m.workers = *w;
  m.totalLines = static_cast<std::size_t>(*t);
  return m;
}

void write_manifest(const fs::path& path, const ShardManifest& manifest) {
  KeyValueLines lines = {
      {"input_path", manifest.inputPath.string()},
      {"output_dir", manifest.outputDir.string()},
      {"max_games", manifest.maxGames ? std::to_string(*manifest.maxGames) : std::string()},
      {"workers", std::to_string(manifest.workers)},
      {"total_lines", std::to_string(manifest.totalLines)},
  };
  for (const auto& p : manifest.shardPaths) lines.emplace_back("shard_path", p.string());
  write_key_values(path, lines);
}

namespace {

bool reusable(const ShardManifest& m, const fs::path& input, const fs::path& shardDir,
              int workers, std::optional<int> maxGames) {
  if (m.inputPath != input || m.outputDir != shardDir || m.maxGames != maxGames ||
      m.workers != workers || m.shardPaths.size() != static_cast<std::size_t>(workers))
    return false;
  for (const auto& p : m.shardPaths) {
    std::error_code ec;
    if (!fs::exists(p, ec)) return false;
  }
  return true;
}

}  // namespace

ShardPlan prepare_shards(const fs::path& input, const fs::path& shardDir, int workers,
                         std::optional<int> maxGames) {
  if (workers < 1) throw ConfigError("workers must be >= 1");

  std::error_code ec;
  fs::create_directories(shardDir, ec);
  if (ec) throw std::runtime_error("Unable to create shard directory " + shardDir.string());

  const fs::path mpath = manifest_path(shardDir);
  if (auto existing = load_manifest(mpath);
      existing && reusable(*existing, input, shardDir, workers, maxGames)) {
    return ShardPlan{std::move(*existing), true};
  }

  std::ifstream in(input);
  if (!in) throw InputError("Unable to open input: " + input.string());

  ShardManifest m;
  m.inputPath = input;
  m.outputDir = shardDir;
  m.maxGames = maxGames;
  m.workers = workers;

  std::vector<std::unique_ptr<std::ofstream>> handles;
  handles.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    m.shardPaths.push_back(shard_path(shardDir, static_cast<std::size_t>(i)));
    handles.push_back(std::make_unique<std::ofstream>(m.shardPaths.back(), std::ios::trunc));
    if (!*handles.back())
      throw std::runtime_error("Unable to write shard " + m.shardPaths.back().string());
  }

  std::string line;
  while (std::getline(in, line)) {
    if (is_blank_line(line)) continue;
    *handles[m.totalLines % static_cast<std::size_t>(workers)] << line << '\n';
    ++m.totalLines;
    if (maxGames && m.totalLines >= static_cast<std::size_t>(*maxGames)) break;
  }

  for (std::size_t i = 0; i < handles.size(); ++i) {
    handles[i]->close();
    if (!*handles[i]) throw std::runtime_error("Failed writing shard " + m.shardPaths[i].string());
  }

  write_manifest(mpath, m);
  return ShardPlan{std::move(m), false};
}

}  // namespace moveeval
