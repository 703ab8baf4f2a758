#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "moveeval/engine/engine_channel.hpp"
#include "moveeval/options.hpp"
#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

struct EvaluateRequest {
  fs::path inputPath;
  fs::path outputPath;
  fs::path shardDir;
  fs::path toolsDir;
  std::optional<int> maxGames;
  int workers = 1;
  EngineDescriptor engine;
};

// Merges CLI overrides over the config file over `defaults` and validates the
// result. Throws ConfigError.
EvaluateRequest build_request(const Options& opts, const EngineDescriptor& defaults);

void validate_request(const EvaluateRequest& req);

// data/processed/<input stem>.evals.ndjson
fs::path default_output_path(const fs::path& input);

struct EvaluateResult {
  bool cached = false;
  EvaluationStats stats;
  std::string enginePath;
  fs::path metadataPath;
};

// Builds the engine factory for a resolved engine binary.
using FactoryBuilder = std::function<engine::EngineFactory(const std::string& enginePath)>;

engine::EngineFactory uci_engine_factory(const std::string& enginePath);

// Cache gate, then the sequential (workers == 1) or parallel path, then the
// run metadata sidecar.
EvaluateResult run_evaluation(const EvaluateRequest& req,
                              const FactoryBuilder& makeFactory = uci_engine_factory);

}  // namespace moveeval
