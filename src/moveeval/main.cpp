#include <exception>
#include <iostream>

#include "moveeval/config.hpp"
#include "moveeval/evaluate.hpp"
#include "moveeval/options.hpp"

int main(int argc, char** argv) {
  using namespace moveeval;

  try {
    const EngineDescriptor defaults = default_engine_descriptor();
    const Options opts = parse_args(argc, argv);
    const EvaluateRequest req = build_request(opts, defaults);
    run_evaluation(req);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
