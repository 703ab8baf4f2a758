#include "moveeval/common.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace moveeval {

std::optional<long long> parse_integer(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t used = 0;
    const long long v = std::stoll(s, &used);
    if (used != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<int> parse_int(const std::string& s) {
  const auto v = parse_integer(s);
  if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
    return std::nullopt;
  return static_cast<int>(*v);
}

std::optional<KeyValueLines> read_key_values(const fs::path& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  KeyValueLines out;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    out.emplace_back(line.substr(0, eq), line.substr(eq + 1));
  }
  if (in.bad()) return std::nullopt;
  return out;
}

void write_key_values(const fs::path& path, const KeyValueLines& lines) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }

  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw std::runtime_error("Unable to write " + tmp.string());
    for (const auto& [k, v] : lines) out << k << '=' << v << '\n';
    out.close();
    if (!out) throw std::runtime_error("Failed writing " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) throw std::runtime_error("Unable to replace " + path.string() + ": " + ec.message());
}

std::string padded_index(std::size_t index, int width) {
  std::ostringstream os;
  os << std::setw(width) << std::setfill('0') << index;
  return os.str();
}

std::string utc_timestamp_now() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
     << micros << "+00:00";
  return os.str();
}

}  // namespace moveeval
