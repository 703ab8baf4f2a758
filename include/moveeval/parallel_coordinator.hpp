#pragma once
#include <filesystem>
#include <optional>
#include <vector>

#include "moveeval/engine/engine_channel.hpp"
#include "moveeval/evaluation_session.hpp"
#include "moveeval/shard_worker.hpp"
#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

struct ParallelSettings {
  fs::path inputPath;
  fs::path outputPath;
  fs::path shardDir;
  int workers = 1;
  std::optional<int> maxGames;
};

// Shards the input, runs one worker process per incomplete shard (at most
// `workers` at a time), sums the counters and merges the part outputs in
// shard order. Throws ShardFailure when any worker fails.
class ParallelCoordinator {
 public:
  ParallelCoordinator(engine::EngineFactory factory, SessionSettings settings);

  EvaluationStats run(const ParallelSettings& ps);

  // Shards skipped on the last run() because their parts were already complete.
  const std::vector<std::size_t>& reused_shards() const { return reused_; }
  // Shards a worker process was launched for on the last run().
  const std::vector<std::size_t>& launched_shards() const { return launched_; }

 private:
  void run_jobs(const std::vector<ShardJob>& jobs, int workers, EvaluationStats& total);

  engine::EngineFactory factory_;
  SessionSettings settings_;
  std::vector<std::size_t> reused_;
  std::vector<std::size_t> launched_;
};

// Removes every "<stem>.part-*" file (outputs and metadata) beside `output`.
void remove_part_files(const fs::path& output);

// Concatenates `parts` into `output` in the given order.
void merge_parts(const fs::path& output, const std::vector<fs::path>& parts);

}  // namespace moveeval
