#include "moveeval/evaluate.hpp"

#include <iostream>
#include <memory>
#include <system_error>

#include "moveeval/common.hpp"
#include "moveeval/config.hpp"
#include "moveeval/engine/uci_engine.hpp"
#include "moveeval/errors.hpp"
#include "moveeval/evaluation_session.hpp"
#include "moveeval/parallel_coordinator.hpp"
#include "moveeval/run_cache.hpp"

namespace moveeval {

fs::path default_output_path(const fs::path& input) {
  return fs::path("data") / "processed" / (input.stem().string() + ".evals.ndjson");
}

EvaluateRequest build_request(const Options& opts, const EngineDescriptor& defaults) {
  EvaluateRequest req;
  req.inputPath = opts.inputPath;
  req.outputPath = opts.outputPath ? fs::path(*opts.outputPath) : default_output_path(req.inputPath);
  if (opts.shardDir) {
    req.shardDir = *opts.shardDir;
  } else {
    req.shardDir = req.outputPath;
    req.shardDir += ".shards";
  }
  req.toolsDir = opts.toolsDir;
  req.maxGames = opts.maxGames;
  req.workers = opts.workers;

  req.engine = load_engine_config(opts.configPath, defaults);
  if (opts.engineName) req.engine.name = *opts.engineName;
  if (opts.engineVersion) req.engine.version = *opts.engineVersion;
  if (opts.depth) req.engine.depth = *opts.depth;
  if (opts.threads) req.engine.threads = *opts.threads;
  if (opts.hashMb) req.engine.hashMb = *opts.hashMb;

  validate_request(req);
  return req;
}

void validate_request(const EvaluateRequest& req) {
  if (req.inputPath.empty()) throw ConfigError("Missing input path");
  if (req.engine.name.empty()) throw ConfigError("Invalid engine name; expected non-empty string");
  if (req.engine.version.empty())
    throw ConfigError("Invalid engine_version; pass --engine-version or set version in [engine]");
  if (req.engine.depth < 1) throw ConfigError("depth must be >= 1");
  if (req.workers < 1) throw ConfigError("workers must be >= 1");
  if (req.maxGames && *req.maxGames < 1) throw ConfigError("max must be >= 1");
}

engine::EngineFactory uci_engine_factory(const std::string& enginePath) {
  return [enginePath]() -> std::unique_ptr<engine::EngineChannel> {
    return std::make_unique<engine::UciEngine>(enginePath);
  };
}

EvaluateResult run_evaluation(const EvaluateRequest& req, const FactoryBuilder& makeFactory) {
  validate_request(req);

  EvaluateResult result;
  result.metadataPath = metadata_path(req.outputPath);

  const CacheDecision cache =
      check_run_cache(RunRequest{req.inputPath, req.outputPath, req.maxGames, req.engine});
  if (cache.state == CacheState::Hit) {
    std::cout << "Skipped evaluation; using existing " << req.outputPath.string() << "\n";
    std::cout << "Metadata: " << result.metadataPath.string() << "\n";
    result.cached = true;
    if (auto meta = load_run_metadata(result.metadataPath)) result.stats = meta->stats;
    return result;
  }

  std::error_code ec;
  if (cache.state == CacheState::Stale) {
    std::cout << "Re-running evaluation; previous run differs (" << cache.reason << ")\n";
    invalidate_run(req.outputPath);
  } else if (fs::exists(req.outputPath, ec)) {
    std::cout << "Replacing " << req.outputPath.string() << " (" << cache.reason << ")\n";
    invalidate_run(req.outputPath);
  }

  result.enginePath = locate_executable(resolve_engine_path(req.engine, req.toolsDir)).string();

  SessionSettings settings;
  settings.engine = req.engine;
  settings.enginePath = result.enginePath;
  settings.maxGames = req.maxGames;

  std::cout << "Evaluating " << req.inputPath.string() << " -> " << req.outputPath.string()
            << "\n";
  std::cout << "Using " << req.engine.name << " " << req.engine.version << " at "
            << result.enginePath << " depth=" << req.engine.depth
            << " threads=" << req.engine.threads << " hash=" << req.engine.hashMb << "MB"
            << " workers=" << req.workers
            << (req.maxGames ? " max=" + std::to_string(*req.maxGames) : std::string()) << "\n";

  const engine::EngineFactory factory = makeFactory(result.enginePath);
  if (req.workers == 1) {
    result.stats = evaluate_file(req.inputPath, req.outputPath, factory, settings);
  } else {
    ParallelCoordinator coordinator(factory, settings);
    result.stats = coordinator.run(ParallelSettings{req.inputPath, req.outputPath, req.shardDir,
                                                    req.workers, req.maxGames});
  }

  RunMetadata meta;
  meta.inputPath = req.inputPath.string();
  meta.outputPath = req.outputPath.string();
  meta.maxGames = req.maxGames;
  meta.fetchedAt = utc_timestamp_now();
  meta.stats = result.stats;
  meta.engine = req.engine;
  write_run_metadata(result.metadataPath, meta);

  std::cout << "Games: " << result.stats.totalGames << " evaluated="
            << result.stats.evaluatedGames
            << " illegal=" << result.stats.skippedIllegalGames
            << " engine_errors=" << result.stats.skippedEngineErrors << "\n";
  std::cout << "Wrote " << req.outputPath.string() << " (" << result.stats.evaluatedGames
            << " games evaluated)\n";
  std::cout << "Metadata: " << result.metadataPath.string() << "\n";
  return result;
}

}  // namespace moveeval
