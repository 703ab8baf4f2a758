#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

// Contents of the "<output>.meta.json" sidecar written after a successful run.
struct RunMetadata {
  std::string inputPath;
  std::string outputPath;
  std::optional<int> maxGames;
  std::string fetchedAt;
  EvaluationStats stats;
  EngineDescriptor engine;
};

// Fingerprint of an evaluation request.
struct RunRequest {
  fs::path inputPath;
  fs::path outputPath;
  std::optional<int> maxGames;
  EngineDescriptor engine;
};

fs::path metadata_path(const fs::path& output);

// nullopt when the sidecar is missing or not a well-formed metadata object.
std::optional<RunMetadata> load_run_metadata(const fs::path& path);

// Writes the sidecar as 2-space indented JSON (temp file + rename).
void write_run_metadata(const fs::path& path, const RunMetadata& meta);

enum class CacheState { Hit, Miss, Stale };

struct CacheDecision {
  CacheState state = CacheState::Miss;
  std::string reason;  // first mismatching field for Stale, cause for Miss
};

// Hit only when the output and its sidecar both exist and the sidecar matches
// `request` field for field.
CacheDecision check_run_cache(const RunRequest& request);

// Removes a stale output and its sidecar so a re-run starts clean.
void invalidate_run(const fs::path& output);

}  // namespace moveeval
