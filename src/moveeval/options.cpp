#include "moveeval/options.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include "moveeval/common.hpp"
#include "moveeval/errors.hpp"

namespace moveeval {

[[noreturn]] static void usage_and_exit(int code) {
  std::cerr
      << "Usage: moveeval evaluate --input <file> [options]\n"
         "Options:\n"
         "  --input <file>            Games as NDJSON, one game per line (required)\n"
         "  --output <file>           Evaluations NDJSON (default data/processed/<stem>.evals.ndjson)\n"
         "  --max <N>                 Evaluate at most N games\n"
         "  --engine <name>           Engine name (default from config, stockfish)\n"
         "  --engine-version <v>      Engine version (required here or in config)\n"
         "  --depth <D>               Search depth per position (default 16)\n"
         "  --threads <N>             Engine Threads option (default 2)\n"
         "  --hash-mb <MB>            Engine Hash option (default 256)\n"
         "  --config <file>           Config file with an [engine] section (default config.toml)\n"
         "  --workers <N>             Parallel worker processes (default 1)\n"
         "  --shard-dir <dir>         Shard directory (default <output>.shards)\n"
         "  --tools-dir <dir>         Engine install tree (default tools)\n";
  std::exit(code);
}

static int int_arg(const std::string& value, const char* name) {
  const auto v = parse_int(value);
  if (!v) throw ConfigError(std::string("Invalid value for ") + name + ": " + value);
  return *v;
}

Options parse_args(int argc, char** argv) {
  Options o;

  if (argc < 2) usage_and_exit(1);
  o.command = argv[1];
  if (o.command == "--help" || o.command == "-h") usage_and_exit(0);
  if (o.command != "evaluate") {
    std::cerr << "Unknown command: " << o.command << "\n";
    usage_and_exit(1);
  }

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(1);
    }
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--input") {
      o.inputPath = require_value(i, "--input");
    } else if (arg == "--output") {
      o.outputPath = require_value(i, "--output");
    } else if (arg == "--max") {
      o.maxGames = int_arg(require_value(i, "--max"), "--max");
    } else if (arg == "--engine") {
      o.engineName = require_value(i, "--engine");
    } else if (arg == "--engine-version") {
      o.engineVersion = require_value(i, "--engine-version");
    } else if (arg == "--depth") {
      o.depth = int_arg(require_value(i, "--depth"), "--depth");
    } else if (arg == "--threads") {
      o.threads = int_arg(require_value(i, "--threads"), "--threads");
    } else if (arg == "--hash-mb") {
      o.hashMb = int_arg(require_value(i, "--hash-mb"), "--hash-mb");
    } else if (arg == "--config") {
      o.configPath = require_value(i, "--config");
    } else if (arg == "--workers") {
      o.workers = int_arg(require_value(i, "--workers"), "--workers");
    } else if (arg == "--shard-dir") {
      o.shardDir = require_value(i, "--shard-dir");
    } else if (arg == "--tools-dir") {
      o.toolsDir = require_value(i, "--tools-dir");
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(1);
    }
  }

  if (o.inputPath.empty()) {
    std::cerr << "Missing required --input\n";
    usage_and_exit(1);
  }
  return o;
}

}  // namespace moveeval
