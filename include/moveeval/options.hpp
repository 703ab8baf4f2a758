#pragma once
#include <optional>
#include <string>

namespace moveeval {

// Command line of `moveeval evaluate`. Engine fields left unset fall back to
// the config file.
struct Options {
  std::string command;

  std::string inputPath;
  std::optional<std::string> outputPath;
  std::optional<int> maxGames;

  std::optional<std::string> engineName;
  std::optional<std::string> engineVersion;
  std::optional<int> depth;
  std::optional<int> threads;
  std::optional<int> hashMb;

  std::string configPath = "config.toml";
  int workers = 1;
  std::optional<std::string> shardDir;
  std::string toolsDir = "tools";
};

// Prints usage and exits on --help, unknown options or missing values.
// Non-numeric values for numeric options throw ConfigError.
Options parse_args(int argc, char** argv);

}  // namespace moveeval
