#include "moveeval/config.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

#include <unistd.h>

#include "moveeval/common.hpp"
#include "moveeval/errors.hpp"

namespace moveeval {

EngineDescriptor default_engine_descriptor() {
  EngineDescriptor d;
  d.name = "stockfish";
  d.version = "";
  d.depth = 16;
  d.threads = 2;
  d.hashMb = 256;
  return d;
}

namespace {

// Drops a trailing "# comment" that is not inside a quoted string.
std::string strip_comment(const std::string& line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string string_value(const std::string& raw, const std::string& key, const fs::path& path) {
  std::string v = raw;
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
    v = v.substr(1, v.size() - 2);
  if (v.empty())
    throw ConfigError("Invalid " + key + " in " + path.string() + "; expected non-empty string");
  return v;
}

int int_value(const std::string& raw, const std::string& key, const fs::path& path) {
  const auto v = parse_int(raw);
  if (!v) throw ConfigError("Invalid " + key + " in " + path.string() + "; expected int");
  return *v;
}

}  // namespace

EngineDescriptor load_engine_config(const fs::path& path, const EngineDescriptor& defaults) {
  std::ifstream in(path);
  if (!in) return defaults;

  EngineDescriptor d = defaults;
  std::string section;
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    line = trim(strip_comment(line));
    if (line.empty()) continue;

    if (line.front() == '[') {
      if (line.back() != ']')
        throw ConfigError(path.string() + ":" + std::to_string(lineNo) + ": bad section header");
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }
    if (section != "engine") continue;

    const auto eq = line.find('=');
    if (eq == std::string::npos)
      throw ConfigError(path.string() + ":" + std::to_string(lineNo) + ": expected key = value");
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));

    if (key == "name") d.name = string_value(value, key, path);
    else if (key == "version") d.version = string_value(value, key, path);
    else if (key == "depth") d.depth = int_value(value, key, path);
    else if (key == "threads") d.threads = int_value(value, key, path);
    else if (key == "hash_mb") d.hashMb = int_value(value, key, path);
  }
  return d;
}

std::string engine_version_token(const std::string& version) {
  static const std::regex re(R"((\d+(?:\.\d+)*))");
  std::smatch m;
  if (!std::regex_search(version, m, re))
    throw ConfigError("Unrecognized Stockfish version: " + version);
  return m[1].str();
}

std::string resolve_engine_path(const EngineDescriptor& engine, const fs::path& toolsDir) {
  if (engine.name == "stockfish") {
    const fs::path candidate =
        toolsDir / "stockfish" / engine_version_token(engine.version) / "stockfish";
    std::error_code ec;
    if (fs::exists(candidate, ec)) return candidate.string();
  }
  return engine.name;
}

namespace {

bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

fs::path locate_executable(const std::string& nameOrPath) {
  if (nameOrPath.empty()) throw ConfigError("Engine path is empty");

  if (nameOrPath.find('/') != std::string::npos) {
    if (!is_executable_file(nameOrPath))
      throw ConfigError("Engine binary not found or not executable: " + nameOrPath);
    std::error_code ec;
    const fs::path abs = fs::absolute(nameOrPath, ec);
    return ec ? fs::path(nameOrPath) : abs;
  }

  const char* env = std::getenv("PATH");
  std::stringstream dirs(env ? env : "");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / nameOrPath;
    if (is_executable_file(candidate)) return candidate;
  }
  throw ConfigError("Engine binary '" + nameOrPath + "' not found on PATH");
}

}  // namespace moveeval
