#include "moveeval/evaluation_session.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "moveeval/errors.hpp"
#include "moveeval/model/board.hpp"
#include "moveeval/record_io.hpp"

namespace moveeval {

const char* to_string(GameOutcome outcome) noexcept {
  switch (outcome) {
    case GameOutcome::Done:
      return "done";
    case GameOutcome::Illegal:
      return "illegal move";
    case GameOutcome::EngineError:
      return "engine error";
  }
  return "unknown";
}

EvaluationSession::EvaluationSession(std::unique_ptr<engine::EngineChannel> engine,
                                     SessionSettings settings)
    : engine_(std::move(engine)), settings_(std::move(settings)) {
  if (!engine_) throw EngineError("no engine channel for evaluation session");
  try {
    engine_->configure(engine::EngineOptions{settings_.engine.threads, settings_.engine.hashMb});
  } catch (...) {
    engine_->close();
    throw;
  }
}

EvaluationSession::~EvaluationSession() {
  if (engine_) engine_->close();
}

GameOutcome EvaluationSession::evaluate_game(const GameRecord& game, std::vector<EvalScore>& evals,
                                             std::string* detail) {
  evals.clear();
  evals.reserve(game.moves.size());

  model::Board board;
  std::vector<std::string> played;
  played.reserve(game.moves.size());

  for (std::size_t i = 0; i < game.moves.size(); ++i) {
    try {
      evals.push_back(engine_->analyse(played, settings_.engine.depth));
    } catch (const EngineError& ex) {
      if (detail) *detail = ex.what();
      return GameOutcome::EngineError;
    }

    const std::string& mv = game.moves[i];
    if (!board.doMoveUCI(mv)) {
      if (detail) *detail = "'" + mv + "' at ply " + std::to_string(i + 1);
      return GameOutcome::Illegal;
    }
    played.push_back(mv);
  }
  return GameOutcome::Done;
}

EvaluationStats EvaluationSession::run(std::istream& in, std::ostream& out,
                                       const std::string& source) {
  EvaluationStats stats;
  std::vector<EvalScore> evals;
  std::string line;
  std::size_t lineNo = 0;

  while (std::getline(in, line)) {
    ++lineNo;
    if (is_blank_line(line)) continue;

    GameRecord game;
    try {
      game = parse_game_record(line);
    } catch (const InputError& ex) {
      throw InputError(source + ":" + std::to_string(lineNo) + ": " + ex.what());
    }
    ++stats.totalGames;

    std::string detail;
    const GameOutcome outcome = evaluate_game(game, evals, &detail);
    switch (outcome) {
      case GameOutcome::Done: {
        EvaluationRecord rec{std::move(game), std::move(evals), settings_.enginePath,
                             settings_.engine};
        out << serialize_evaluation_record(rec) << '\n';
        if (!out) throw std::runtime_error("Failed writing evaluation output for " + source);
        ++stats.evaluatedGames;
        evals = {};
        break;
      }
      case GameOutcome::Illegal:
        ++stats.skippedIllegalGames;
        std::cerr << "Skipped game " << source << ":" << lineNo << " (" << to_string(outcome)
                  << " " << detail << ")\n";
        break;
      case GameOutcome::EngineError:
        ++stats.skippedEngineErrors;
        std::cerr << "Skipped game " << source << ":" << lineNo << " (" << to_string(outcome)
                  << ": " << detail << ")\n";
        break;
    }

    if (settings_.maxGames && stats.totalGames >= static_cast<std::size_t>(*settings_.maxGames))
      break;
  }
  return stats;
}

EvaluationStats evaluate_file(const fs::path& input, const fs::path& output,
                              const engine::EngineFactory& factory,
                              const SessionSettings& settings) {
  std::ifstream in(input);
  if (!in) throw InputError("Unable to open input: " + input.string());

  if (output.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(output.parent_path(), ec);
  }
  std::ofstream out(output, std::ios::trunc);
  if (!out) throw std::runtime_error("Unable to write output: " + output.string());

  EvaluationSession session(factory(), settings);
  const EvaluationStats stats = session.run(in, out, input.string());

  out.close();
  if (!out) throw std::runtime_error("Failed to finish output: " + output.string());
  return stats;
}

}  // namespace moveeval
