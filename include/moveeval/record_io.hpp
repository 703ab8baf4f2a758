#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "moveeval/types.hpp"

namespace moveeval {

using json = nlohmann::ordered_json;

// Parses one NDJSON game line: {"headers": {...}, "moves": [...], "clocks": [...]}.
// Throws InputError when the line is not a game record.
GameRecord parse_game_record(const std::string& line);

json eval_score_to_json(const EvalScore& score);

// One output line (no trailing newline):
// {headers, moves, clocks, evals, engine:{path, version, depth, threads, hash_mb}}
std::string serialize_evaluation_record(const EvaluationRecord& record);

bool is_blank_line(const std::string& line) noexcept;

}  // namespace moveeval
