#pragma once
#include <optional>
#include <string>
#include <vector>

#include "moveeval/engine/engine_channel.hpp"

namespace moveeval::engine {

// Persistent UCI engine process (Stockfish or compatible) driven over pipes.
class UciEngine : public EngineChannel {
 public:
  // Spawns the binary and completes the uci/isready handshake. Throws EngineError.
  explicit UciEngine(const std::string& exePath);
  ~UciEngine() override;

  UciEngine(const UciEngine&) = delete;
  UciEngine& operator=(const UciEngine&) = delete;

  void configure(const EngineOptions& opts) override;
  EvalScore analyse(const std::vector<std::string>& moves, int depth) override;
  void close() noexcept override;

  // Parses one "info ..." line. Returns the score if the line carries one for the main line.
  static std::optional<EvalScore> parse_info_score(const std::string& line);

 private:
  struct Impl;
  Impl* impl_{nullptr};
};

}  // namespace moveeval::engine
