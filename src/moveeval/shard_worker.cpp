#include "moveeval/shard_worker.hpp"

#include <string>

#include "moveeval/common.hpp"

namespace moveeval {

fs::path part_output_path(const fs::path& output, std::size_t index) {
  return output.parent_path() /
         (output.stem().string() + ".part-" + padded_index(index) + output.extension().string());
}

fs::path part_meta_path(const fs::path& partPath) {
  fs::path p = partPath;
  p += ".meta.txt";
  return p;
}

void write_part_metadata(const fs::path& path, const PartMetadata& meta) {
  write_key_values(path, {
                             {"total_games", std::to_string(meta.stats.totalGames)},
                             {"evaluated_games", std::to_string(meta.stats.evaluatedGames)},
                             {"skipped_illegal_games", std::to_string(meta.stats.skippedIllegalGames)},
                             {"skipped_engine_errors", std::to_string(meta.stats.skippedEngineErrors)},
                             {"engine_name", meta.engine.name},
                             {"engine_version", meta.engine.version},
                             {"depth", std::to_string(meta.engine.depth)},
                             {"threads", std::to_string(meta.engine.threads)},
                             {"hash_mb", std::to_string(meta.engine.hashMb)},
                         });
}

std::optional<PartMetadata> read_part_metadata(const fs::path& path) {
  const auto lines = read_key_values(path);
  if (!lines) return std::nullopt;

  std::optional<long long> total, evaluated, illegal, engineErrors;
  std::optional<int> depth, threads, hashMb;
  std::optional<std::string> name, version;
  for (const auto& [key, value] : *lines) {
    if (value.empty()) continue;
    auto number = [&](std::optional<long long>& slot) { slot = parse_integer(value); };
    auto small = [&](std::optional<int>& slot) { slot = parse_int(value); };
    if (key == "total_games") number(total);
    else if (key == "evaluated_games") number(evaluated);
    else if (key == "skipped_illegal_games") number(illegal);
    else if (key == "skipped_engine_errors") number(engineErrors);
    else if (key == "depth") small(depth);
    else if (key == "threads") small(threads);
    else if (key == "hash_mb") small(hashMb);
    else if (key == "engine_name") name = value;
    else if (key == "engine_version") version = value;
  }

  if (!total || !evaluated || !illegal || !engineErrors) return std::nullopt;
  if (*total < 0 || *evaluated < 0 || *illegal < 0 || *engineErrors < 0) return std::nullopt;
  if (!name || !version || !depth || !threads || !hashMb) return std::nullopt;

  PartMetadata meta;
  meta.stats.totalGames = static_cast<std::size_t>(*total);
  meta.stats.evaluatedGames = static_cast<std::size_t>(*evaluated);
  meta.stats.skippedIllegalGames = static_cast<std::size_t>(*illegal);
  meta.stats.skippedEngineErrors = static_cast<std::size_t>(*engineErrors);
  if (!meta.stats.consistent()) return std::nullopt;

  meta.engine.name = *name;
  meta.engine.version = *version;
  meta.engine.depth = *depth;
  meta.engine.threads = *threads;
  meta.engine.hashMb = *hashMb;
  return meta;
}

EvaluationStats run_shard_worker(const ShardJob& job, const engine::EngineFactory& factory,
                                 const SessionSettings& settings) {
  // The planner already applied the run-wide cap.
  SessionSettings shardSettings = settings;
  shardSettings.maxGames.reset();

  const EvaluationStats stats = evaluate_file(job.shardPath, job.partPath, factory, shardSettings);
  write_part_metadata(job.metaPath, PartMetadata{stats, settings.engine});
  return stats;
}

}  // namespace moveeval
