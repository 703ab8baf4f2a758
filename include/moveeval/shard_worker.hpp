#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>

#include "moveeval/engine/engine_channel.hpp"
#include "moveeval/evaluation_session.hpp"
#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

struct ShardJob {
  std::size_t index = 0;
  fs::path shardPath;  // input lines for this shard
  fs::path partPath;   // evaluated records
  fs::path metaPath;   // counters, written last
};

// "<stem>.part-NNN<ext>" next to the final output.
fs::path part_output_path(const fs::path& output, std::size_t index);
// "<part>.meta.txt"
fs::path part_meta_path(const fs::path& partPath);

struct PartMetadata {
  EvaluationStats stats;
  EngineDescriptor engine;
};

void write_part_metadata(const fs::path& path, const PartMetadata& meta);
// nullopt when missing, incomplete, or not numeric.
std::optional<PartMetadata> read_part_metadata(const fs::path& path);

// Evaluates one shard start to finish and persists its metadata. Runs inside
// the worker process; any exception is fatal to the shard.
EvaluationStats run_shard_worker(const ShardJob& job, const engine::EngineFactory& factory,
                                 const SessionSettings& settings);

}  // namespace moveeval
