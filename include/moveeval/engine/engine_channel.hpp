#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "moveeval/types.hpp"

namespace moveeval::engine {

struct EngineOptions {
  int threads = 0;  // <= 0 => leave engine default
  int hashMb = 0;   // <= 0 => leave engine default
};

// Narrow capability the evaluation core needs from an analysis engine.
// Implementations throw EngineError on any channel failure.
class EngineChannel {
 public:
  virtual ~EngineChannel() = default;

  virtual void configure(const EngineOptions& opts) = 0;

  // Score of the position reached from the start position by `moves`, from the
  // point of view of the side to move there.
  virtual EvalScore analyse(const std::vector<std::string>& moves, int depth) = 0;

  // Releases the engine. Safe to call more than once.
  virtual void close() noexcept = 0;
};

using EngineFactory = std::function<std::unique_ptr<EngineChannel>()>;

}  // namespace moveeval::engine
