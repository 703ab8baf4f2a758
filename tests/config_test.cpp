#include <cassert>
#include <string>
#include <vector>

#include "moveeval/config.hpp"
#include "moveeval/errors.hpp"
#include "moveeval/evaluate.hpp"
#include "moveeval/options.hpp"
#include "test_support.hpp"

using namespace moveeval;
using namespace moveeval::testing;

static Options parse(std::vector<std::string> args)
{
  args.insert(args.begin(), "moveeval");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(args.size()), argv.data());
}

template <class Fn>
static bool throws_config_error(Fn fn)
{
  try {
    fn();
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

int main()
{
  const EngineDescriptor defaults = default_engine_descriptor();
  assert(defaults.name == "stockfish");
  assert(defaults.version.empty());
  assert(defaults.depth == 16 && defaults.threads == 2 && defaults.hashMb == 256);

  TempDir dir("config");

  // Missing file or section: defaults.
  {
    assert(load_engine_config(dir / "missing.toml", defaults) == defaults);
    write_file(dir / "other.toml", "[data]\ndepth = 3\n");
    assert(load_engine_config(dir / "other.toml", defaults) == defaults);
  }

  // Values from the [engine] section, comments and quotes allowed.
  {
    write_file(dir / "config.toml",
               "# evaluation settings\n"
               "[paths]\n"
               "name = \"ignored\"\n"
               "\n"
               "[engine]\n"
               "name = \"stockfish\"  # engine family\n"
               "version = \"Stockfish 16.1\"\n"
               "depth = 20\n"
               "hash_mb = 512\n");
    const EngineDescriptor d = load_engine_config(dir / "config.toml", defaults);
    assert(d.name == "stockfish");
    assert(d.version == "Stockfish 16.1");
    assert(d.depth == 20);
    assert(d.threads == 2);
    assert(d.hashMb == 512);
  }

  // Bad values are configuration errors.
  {
    write_file(dir / "bad.toml", "[engine]\ndepth = deep\n");
    assert(throws_config_error([&] { load_engine_config(dir / "bad.toml", defaults); }));
    write_file(dir / "empty-name.toml", "[engine]\nname = \"\"\n");
    assert(throws_config_error([&] { load_engine_config(dir / "empty-name.toml", defaults); }));
    write_file(dir / "no-eq.toml", "[engine]\ndepth 12\n");
    assert(throws_config_error([&] { load_engine_config(dir / "no-eq.toml", defaults); }));
    // 2^32 + 16 would wrap to 16 if narrowed.
    write_file(dir / "huge.toml", "[engine]\ndepth = 4294967312\n");
    assert(throws_config_error([&] { load_engine_config(dir / "huge.toml", defaults); }));
  }

  // Version tokens and engine path resolution.
  {
    assert(engine_version_token("Stockfish 16.1") == "16.1");
    assert(engine_version_token("17") == "17");
    assert(throws_config_error([] { engine_version_token("dev"); }));

    EngineDescriptor e = defaults;
    e.version = "16.1";
    assert(resolve_engine_path(e, dir / "tools") == "stockfish");

    const fs::path bin = dir / "tools" / "stockfish" / "16.1" / "stockfish";
    fs::create_directories(bin.parent_path());
    write_file(bin, "#!/bin/sh\n");
    assert(resolve_engine_path(e, dir / "tools") == bin.string());

    // Not executable yet.
    fs::permissions(bin, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::remove);
    assert(throws_config_error([&] { locate_executable(bin.string()); }));
    fs::permissions(bin, fs::perms::owner_all, fs::perm_options::add);
    assert(fs::equivalent(locate_executable(bin.string()), bin));

    e.name = "other-engine";
    assert(resolve_engine_path(e, dir / "tools") == "other-engine");
    assert(throws_config_error([] { locate_executable("moveeval-no-such-engine-binary"); }));
    assert(!locate_executable("sh").empty());
  }

  // Command line.
  {
    const Options o = parse({"evaluate", "--input", "games.ndjson", "--max", "10", "--depth",
                             "18", "--workers", "4", "--engine-version", "16"});
    assert(o.command == "evaluate");
    assert(o.inputPath == "games.ndjson");
    assert(o.maxGames == 10);
    assert(o.depth == 18);
    assert(o.workers == 4);
    assert(o.engineVersion == std::string("16"));
    assert(!o.threads);
    assert(o.configPath == "config.toml");
    assert(o.toolsDir == "tools");

    assert(throws_config_error([] { parse({"evaluate", "--input", "x", "--depth", "abc"}); }));
    assert(throws_config_error(
        [] { parse({"evaluate", "--input", "x", "--max", "4294967297"}); }));
    assert(throws_config_error(
        [] { parse({"evaluate", "--input", "x", "--depth", "4294967312"}); }));
    assert(throws_config_error(
        [] { parse({"evaluate", "--input", "x", "--workers", "-4294967295"}); }));
  }

  // Request: CLI over config over defaults, plus derived paths.
  {
    write_file(dir / "cli.toml", "[engine]\nversion = \"15\"\nthreads = 6\n");
    Options o;
    o.command = "evaluate";
    o.inputPath = "raw/lichess_2024-01.ndjson";
    o.configPath = (dir / "cli.toml").string();
    o.threads = 3;
    const EvaluateRequest req = build_request(o, defaults);
    assert(req.engine.version == "15");
    assert(req.engine.threads == 3);
    assert(req.engine.depth == 16);
    assert(req.outputPath == fs::path("data") / "processed" / "lichess_2024-01.evals.ndjson");
    assert(req.shardDir.string() == req.outputPath.string() + ".shards");
    assert(req.workers == 1);

    Options noVersion = o;
    noVersion.configPath = (dir / "missing.toml").string();
    assert(throws_config_error([&] { build_request(noVersion, defaults); }));

    Options shallow = o;
    shallow.depth = 0;
    assert(throws_config_error([&] { build_request(shallow, defaults); }));

    Options noWorkers = o;
    noWorkers.workers = 0;
    assert(throws_config_error([&] { build_request(noWorkers, defaults); }));

    Options noGames = o;
    noGames.maxGames = 0;
    assert(throws_config_error([&] { build_request(noGames, defaults); }));
  }

  return 0;
}
