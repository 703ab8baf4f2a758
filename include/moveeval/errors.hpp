#pragma once
#include <stdexcept>
#include <string>

namespace moveeval {

// Engine channel failure. Recoverable per game, fatal while a session starts.
struct EngineError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Invalid configuration or command-line values. Raised before any engine is spawned.
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Unreadable input or a line that is not a game record.
struct InputError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A shard worker process died or exited non-zero.
struct ShardFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace moveeval
