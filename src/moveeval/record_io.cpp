#include "moveeval/record_io.hpp"

#include <cctype>

#include "moveeval/errors.hpp"

namespace moveeval {

GameRecord parse_game_record(const std::string& line) {
  json payload;
  try {
    payload = json::parse(line);
  } catch (const json::parse_error& ex) {
    throw InputError(std::string("invalid JSON: ") + ex.what());
  }
  if (!payload.is_object()) throw InputError("game record is not a JSON object");

  GameRecord rec;
  try {
    for (const auto& [key, value] : payload.at("headers").items()) {
      rec.headers.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
    }
    rec.moves = payload.at("moves").get<std::vector<std::string>>();
    rec.clocks = payload.at("clocks").get<std::vector<double>>();
  } catch (const json::exception& ex) {
    throw InputError(std::string("malformed game record: ") + ex.what());
  }
  return rec;
}

json eval_score_to_json(const EvalScore& score) {
  json j = json::object();
  j["cp"] = score.cp ? json(*score.cp) : json(nullptr);
  j["mate"] = score.mate ? json(*score.mate) : json(nullptr);
  return j;
}

std::string serialize_evaluation_record(const EvaluationRecord& record) {
  json headers = json::object();
  for (const auto& [key, value] : record.game.headers) headers[key] = value;

  json evals = json::array();
  for (const auto& e : record.evals) evals.push_back(eval_score_to_json(e));

  json out = json::object();
  out["headers"] = std::move(headers);
  out["moves"] = record.game.moves;
  out["clocks"] = record.game.clocks;
  out["evals"] = std::move(evals);
  out["engine"] = {{"path", record.enginePath},
                   {"version", record.engine.version},
                   {"depth", record.engine.depth},
                   {"threads", record.engine.threads},
                   {"hash_mb", record.engine.hashMb}};
  return out.dump();
}

bool is_blank_line(const std::string& line) noexcept {
  for (unsigned char c : line)
    if (!std::isspace(c)) return false;
  return true;
}

}  // namespace moveeval
