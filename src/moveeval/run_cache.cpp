#include "moveeval/run_cache.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>

#include "moveeval/record_io.hpp"

namespace moveeval {

fs::path metadata_path(const fs::path& output) {
  fs::path p = output;
  p += ".meta.json";
  return p;
}

namespace {

json engine_to_json(const EngineDescriptor& e) {
  return json{{"name", e.name},
              {"version", e.version},
              {"depth", e.depth},
              {"threads", e.threads},
              {"hash_mb", e.hashMb}};
}

std::size_t counter(const json& stats, const char* key) {
  const long long v = stats.at(key).get<long long>();
  if (v < 0) throw std::out_of_range(std::string("negative counter ") + key);
  return static_cast<std::size_t>(v);
}

int int_field(const json& obj, const char* key) {
  const long long v = obj.at(key).get<long long>();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
    throw std::out_of_range(std::string("int field out of range ") + key);
  return static_cast<int>(v);
}

}  // namespace

std::optional<RunMetadata> load_run_metadata(const fs::path& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  try {
    const json j = json::parse(in);
    RunMetadata m;
    m.inputPath = j.at("input_path").get<std::string>();
    m.outputPath = j.at("output_path").get<std::string>();
    if (!j.at("max_games").is_null()) m.maxGames = int_field(j, "max_games");
    if (j.contains("fetched_at") && j.at("fetched_at").is_string())
      m.fetchedAt = j.at("fetched_at").get<std::string>();

    const json& stats = j.at("stats");
    m.stats.totalGames = counter(stats, "total_games");
    m.stats.evaluatedGames = counter(stats, "evaluated_games");
    m.stats.skippedIllegalGames = counter(stats, "skipped_illegal_games");
    m.stats.skippedEngineErrors = counter(stats, "skipped_engine_errors");

    const json& e = j.at("engine");
    m.engine.name = e.at("name").get<std::string>();
    m.engine.version = e.at("version").get<std::string>();
    m.engine.depth = int_field(e, "depth");
    m.engine.threads = int_field(e, "threads");
    m.engine.hashMb = int_field(e, "hash_mb");
    return m;
  } catch (const json::exception&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

void write_run_metadata(const fs::path& path, const RunMetadata& meta) {
  json j = json::object();
  j["input_path"] = meta.inputPath;
  j["output_path"] = meta.outputPath;
  j["max_games"] = meta.maxGames ? json(*meta.maxGames) : json(nullptr);
  j["fetched_at"] = meta.fetchedAt;
  j["stats"] = {{"total_games", meta.stats.totalGames},
                {"evaluated_games", meta.stats.evaluatedGames},
                {"skipped_illegal_games", meta.stats.skippedIllegalGames},
                {"skipped_engine_errors", meta.stats.skippedEngineErrors}};
  j["engine"] = engine_to_json(meta.engine);

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw std::runtime_error("Unable to write " + tmp.string());
    out << j.dump(2) << '\n';
    out.close();
    if (!out) throw std::runtime_error("Failed writing " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) throw std::runtime_error("Unable to replace " + path.string() + ": " + ec.message());
}

CacheDecision check_run_cache(const RunRequest& request) {
  std::error_code ec;
  const fs::path metaPath = metadata_path(request.outputPath);
  if (!fs::exists(request.outputPath, ec)) return {CacheState::Miss, "no output"};
  if (!fs::exists(metaPath, ec)) return {CacheState::Miss, "no metadata"};

  const auto meta = load_run_metadata(metaPath);
  if (!meta) return {CacheState::Stale, "unreadable metadata"};

  if (meta->inputPath != request.inputPath.string()) return {CacheState::Stale, "input_path"};
  if (meta->outputPath != request.outputPath.string()) return {CacheState::Stale, "output_path"};
  if (meta->maxGames != request.maxGames) return {CacheState::Stale, "max_games"};

  const EngineDescriptor& had = meta->engine;
  const EngineDescriptor& want = request.engine;
  if (had.name != want.name) return {CacheState::Stale, "engine name"};
  if (had.version != want.version) return {CacheState::Stale, "engine version"};
  if (had.depth != want.depth) return {CacheState::Stale, "depth"};
  if (had.threads != want.threads) return {CacheState::Stale, "threads"};
  if (had.hashMb != want.hashMb) return {CacheState::Stale, "hash_mb"};

  return {CacheState::Hit, {}};
}

void invalidate_run(const fs::path& output) {
  std::error_code ec;
  fs::remove(output, ec);
  fs::remove(metadata_path(output), ec);
}

}  // namespace moveeval
