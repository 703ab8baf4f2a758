#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

// stockfish, no version, depth 16, 2 threads, 256 MB hash.
EngineDescriptor default_engine_descriptor();

// Reads the [engine] section of a TOML-style file:
//   [engine]
//   name = "stockfish"
//   version = "17"
//   depth = 18
// Missing file or section => `defaults`. Bad values throw ConfigError.
EngineDescriptor load_engine_config(const fs::path& path, const EngineDescriptor& defaults);

// First dotted number in a version label ("Stockfish 16.1" -> "16.1").
std::string engine_version_token(const std::string& version);

// <tools>/stockfish/<version token>/stockfish for stockfish when installed,
// otherwise the engine name itself.
std::string resolve_engine_path(const EngineDescriptor& engine, const fs::path& toolsDir);

// Absolute path of an executable; names without '/' are searched on PATH.
// Throws ConfigError when nothing executable is found.
fs::path locate_executable(const std::string& nameOrPath);

}  // namespace moveeval
