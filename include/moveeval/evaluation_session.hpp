#pragma once
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "moveeval/engine/engine_channel.hpp"
#include "moveeval/types.hpp"

namespace moveeval {

namespace fs = std::filesystem;

enum class GameOutcome { Done, Illegal, EngineError };

const char* to_string(GameOutcome outcome) noexcept;

struct SessionSettings {
  EngineDescriptor engine;
  std::string enginePath;           // recorded in every output line
  std::optional<int> maxGames;      // cap on games read, across the whole input
};

// Drives one persistent engine through a sequence of games. The engine is
// configured once on construction and closed on destruction.
class EvaluationSession {
 public:
  EvaluationSession(std::unique_ptr<engine::EngineChannel> engine, SessionSettings settings);
  ~EvaluationSession();

  EvaluationSession(const EvaluationSession&) = delete;
  EvaluationSession& operator=(const EvaluationSession&) = delete;

  // Evaluates one game from the start position. On Done, `evals` holds one score per move.
  GameOutcome evaluate_game(const GameRecord& game, std::vector<EvalScore>& evals,
                            std::string* detail = nullptr);

  // Reads NDJSON games from `in`, writes one record per evaluated game to `out`.
  // `source` only labels diagnostics.
  EvaluationStats run(std::istream& in, std::ostream& out, const std::string& source = "<input>");

 private:
  std::unique_ptr<engine::EngineChannel> engine_;
  SessionSettings settings_;
};

// Sequential path: evaluates `input` into `output` (truncated) with one engine from `factory`.
EvaluationStats evaluate_file(const fs::path& input, const fs::path& output,
                              const engine::EngineFactory& factory,
                              const SessionSettings& settings);

}  // namespace moveeval
