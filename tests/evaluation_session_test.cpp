#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "moveeval/errors.hpp"
#include "moveeval/evaluation_session.hpp"
#include "test_support.hpp"

using namespace moveeval;
using namespace moveeval::testing;

static SessionSettings settings_with(std::optional<int> maxGames = std::nullopt)
{
  SessionSettings s;
  s.engine = EngineDescriptor{"stockfish", "16", 8, 3, 64};
  s.enginePath = "/opt/engines/stockfish";
  s.maxGames = maxGames;
  return s;
}

static std::vector<nlohmann::json> parse_lines(const std::string& text)
{
  std::vector<nlohmann::json> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(nlohmann::json::parse(line));
  return out;
}

int main()
{
  // Constant cp=0 engine over a three-move game: three zero scores.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log), settings_with());
    assert(log->configured == 1);
    assert(log->options.threads == 3);
    assert(log->options.hashMb == 64);

    std::istringstream in(game_line("a", {"e2e4", "e7e5", "g1f3"}) + "\n");
    std::ostringstream out;
    const EvaluationStats stats = session.run(in, out);
    assert(stats == (EvaluationStats{1, 1, 0, 0}));

    const auto records = parse_lines(out.str());
    assert(records.size() == 1);
    const auto& rec = records[0];
    assert(rec["moves"].size() == 3);
    assert(rec["evals"].size() == rec["moves"].size());
    for (const auto& e : rec["evals"]) {
      assert(e["cp"] == 0);
      assert(e["mate"].is_null());
    }
    assert(rec["clocks"].size() == 3);
    assert(rec["headers"]["Site"] == "a");
    assert(rec["engine"]["path"] == "/opt/engines/stockfish");
    assert(rec["engine"]["version"] == "16");
    assert(rec["engine"]["depth"] == 8);
    assert(rec["engine"]["threads"] == 3);
    assert(rec["engine"]["hash_mb"] == 64);

    // Each request carries the played prefix from the start position.
    assert(log->positions.size() == 3);
    assert(log->positions[0].empty());
    assert(log->positions[1] == (std::vector<std::string>{"e2e4"}));
    assert(log->positions[2] == (std::vector<std::string>{"e2e4", "e7e5"}));
  }
  // Exact output line for a depth-1 run with a cp=0 engine.
  {
    auto log = std::make_shared<StubEngine::Log>();
    SessionSettings s = settings_with();
    s.engine.depth = 1;
    EvaluationSession session(std::make_unique<StubEngine>(log), s);
    std::istringstream in("{\"headers\":{},\"moves\":[\"e2e4\",\"e7e5\"],\"clocks\":[60.0,60.0]}\n");
    std::ostringstream out;
    assert(session.run(in, out) == (EvaluationStats{1, 1, 0, 0}));
    assert(out.str().find("\"evals\":[{\"cp\":0,\"mate\":null},{\"cp\":0,\"mate\":null}]") !=
           std::string::npos);
    assert(out.str().rfind("{\"headers\":{},\"moves\":[\"e2e4\",\"e7e5\"]", 0) == 0);
  }

  // Session end releases the engine.
  {
    auto log = std::make_shared<StubEngine::Log>();
    {
      EvaluationSession session(std::make_unique<StubEngine>(log), settings_with());
    }
    assert(log->closed >= 1);
  }

  // Illegal second move: skipped, no output, first position still analysed.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log), settings_with());
    std::istringstream in(game_line("bad", {"e2e4", "e2e4"}) + "\n");
    std::ostringstream out;
    const EvaluationStats stats = session.run(in, out);
    assert(stats == (EvaluationStats{1, 0, 1, 0}));
    assert(out.str().empty());
    assert(log->analysed == 2);
  }

  // Engine failure on one game does not stop the next one.
  {
    auto log = std::make_shared<StubEngine::Log>();
    auto engine = std::make_unique<StubEngine>(log);
    int calls = 0;
    engine->fail = [&calls](const std::vector<std::string>&) { return ++calls == 2; };
    EvaluationSession session(std::move(engine), settings_with());

    std::istringstream in(game_line("x", {"e2e4", "e7e5"}) + "\n" +
                          game_line("y", {"d2d4", "d7d5"}) + "\n");
    std::ostringstream out;
    const EvaluationStats stats = session.run(in, out);
    assert(stats == (EvaluationStats{2, 1, 0, 1}));
    assert(stats.consistent());
    const auto records = parse_lines(out.str());
    assert(records.size() == 1);
    assert(records[0]["headers"]["Site"] == "y");
  }

  // evaluate_game reports the outcome directly.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log, EvalScore::mate_in(-2)),
                              settings_with());
    GameRecord game;
    game.moves = {"g2g4", "e7e5", "f2f3"};
    game.clocks = {1, 1, 1};
    std::vector<EvalScore> evals;
    assert(session.evaluate_game(game, evals) == GameOutcome::Done);
    assert(evals.size() == 3);
    assert(evals[1] == EvalScore::mate_in(-2));

    game.moves.push_back("e1e3");
    std::string detail;
    assert(session.evaluate_game(game, evals, &detail) == GameOutcome::Illegal);
    assert(detail.find("e1e3") != std::string::npos);
  }

  // Empty move list is a complete game with no evaluations.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log), settings_with());
    std::istringstream in(game_line("empty", {}) + "\n");
    std::ostringstream out;
    assert(session.run(in, out) == (EvaluationStats{1, 1, 0, 0}));
    const auto records = parse_lines(out.str());
    assert(records.size() == 1);
    assert(records[0]["evals"].empty());
    assert(log->analysed == 0);
  }

  // The cap counts games read, blank lines are not games.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log), settings_with(2));
    std::istringstream in("\n" + game_line("1", {"e2e4"}) + "\n\n" +
                          game_line("2", {"e2e5"}) + "\n" + game_line("3", {"d2d4"}) + "\n");
    std::ostringstream out;
    const EvaluationStats stats = session.run(in, out);
    assert(stats == (EvaluationStats{2, 1, 1, 0}));
    assert(parse_lines(out.str()).size() == 1);
  }

  // A malformed line is fatal and names its line number.
  {
    auto log = std::make_shared<StubEngine::Log>();
    EvaluationSession session(std::make_unique<StubEngine>(log), settings_with());
    std::istringstream in(game_line("ok", {"e2e4"}) + "\n{\"headers\":{}}\n");
    std::ostringstream out;
    bool threw = false;
    try {
      session.run(in, out, "games.ndjson");
    } catch (const InputError& ex) {
      threw = std::string(ex.what()).find("games.ndjson:2") != std::string::npos;
    }
    assert(threw);
  }

  // evaluate_file: one engine for the whole file, output truncated.
  {
    TempDir dir("session");
    const auto input = dir / "in.ndjson";
    const auto output = dir / "nested" / "out.ndjson";
    write_file(input, numbered_games(4));
    fs::create_directories(output.parent_path());
    write_file(output, "stale\n");

    StubFactory stubs;
    const EvaluationStats stats = evaluate_file(input, output, stubs.factory(), settings_with());
    assert(stats == (EvaluationStats{4, 4, 0, 0}));
    assert(*stubs.created == 1);
    assert(stubs.log->configured == 1);
    assert(stubs.log->closed >= 1);
    const auto lines = read_lines(output);
    assert(lines.size() == 4);
    assert(lines[0].find("stale") == std::string::npos);
  }

  // Missing input is an input error.
  {
    StubFactory stubs;
    bool threw = false;
    try {
      evaluate_file("/nonexistent/moveeval/in.ndjson", fs::temp_directory_path() / "x.ndjson",
                    stubs.factory(), settings_with());
    } catch (const InputError&) {
      threw = true;
    }
    assert(threw);
    assert(*stubs.created == 0);
  }

  return 0;
}
