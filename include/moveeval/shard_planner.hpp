#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace moveeval {

namespace fs = std::filesystem;

struct ShardManifest {
  fs::path inputPath;
  fs::path outputDir;
  std::optional<int> maxGames;
  int workers = 1;
  std::size_t totalLines = 0;
  std::vector<fs::path> shardPaths;  // index order
};

struct ShardPlan {
  ShardManifest manifest;
  bool reused = false;  // false => shard files were (re)written
};

fs::path manifest_path(const fs::path& shardDir);
fs::path shard_path(const fs::path& shardDir, std::size_t index);

// nullopt when the manifest is missing or does not parse.
std::optional<ShardManifest> load_manifest(const fs::path& path);
void write_manifest(const fs::path& path, const ShardManifest& manifest);

// Round-robin partition of the non-blank lines of `input` into `workers` shard
// files under `shardDir`. Reuses the existing manifest when every parameter
// matches and all shard files still exist; otherwise regenerates everything.
ShardPlan prepare_shards(const fs::path& input, const fs::path& shardDir, int workers,
                         std::optional<int> maxGames);

}  // namespace moveeval
