#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace moveeval {

// Score relative to the side to move. At most one of cp/mate is set; neither => unknown.
struct EvalScore {
  std::optional<int> cp;
  std::optional<int> mate;

  static EvalScore centipawns(int v) { return EvalScore{v, std::nullopt}; }
  static EvalScore mate_in(int n) { return EvalScore{std::nullopt, n}; }
  static EvalScore unknown() { return EvalScore{}; }

  bool is_unknown() const noexcept { return !cp && !mate; }
  bool operator==(const EvalScore&) const = default;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct GameRecord {
  HeaderList headers;               // tag order as read
  std::vector<std::string> moves;   // coordinate notation, e.g. "e2e4", "e7e8q"
  std::vector<double> clocks;       // seconds remaining after each move
};

struct EngineDescriptor {
  std::string name;
  std::string version;
  int depth = 16;
  int threads = 2;
  int hashMb = 256;

  bool operator==(const EngineDescriptor&) const = default;
};

struct EvaluationRecord {
  GameRecord game;
  std::vector<EvalScore> evals;  // one per move
  std::string enginePath;
  EngineDescriptor engine;
};

struct EvaluationStats {
  std::size_t totalGames = 0;
  std::size_t evaluatedGames = 0;
  std::size_t skippedIllegalGames = 0;
  std::size_t skippedEngineErrors = 0;

  EvaluationStats& operator+=(const EvaluationStats& o) {
    totalGames += o.totalGames;
    evaluatedGames += o.evaluatedGames;
    skippedIllegalGames += o.skippedIllegalGames;
    skippedEngineErrors += o.skippedEngineErrors;
    return *this;
  }

  bool consistent() const noexcept {
    return totalGames == evaluatedGames + skippedIllegalGames + skippedEngineErrors;
  }

  bool operator==(const EvaluationStats&) const = default;
};

}  // namespace moveeval
