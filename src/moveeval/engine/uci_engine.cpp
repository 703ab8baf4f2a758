#include "moveeval/engine/uci_engine.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string_view>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "moveeval/errors.hpp"

namespace moveeval::engine {

namespace {

inline bool starts_with(const std::string& s, std::string_view pfx) {
  return s.rfind(std::string(pfx), 0) == 0;
}

inline std::optional<int> to_int(const std::string& s) {
  try {
    std::size_t used = 0;
    const int v = std::stoi(s, &used);
    if (used != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

inline std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> v;
  std::istringstream is(s);
  std::string t;
  while (is >> t) v.push_back(std::move(t));
  return v;
}

inline std::string trim_crlf(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

}  // namespace

struct UciEngine::Impl {
  std::string exePath;

  pid_t pid{-1};
  FILE* fin{nullptr};
  FILE* fout{nullptr};
  bool dead{false};

  explicit Impl(std::string path) : exePath(std::move(path)) {}

  void spawn() {
    // A dead engine must surface as EngineError on write, not kill this process.
    std::signal(SIGPIPE, SIG_IGN);

    int inpipe[2]{-1, -1}, outpipe[2]{-1, -1};
    if (pipe(inpipe) != 0) throw EngineError("pipe() failed for " + exePath);
    if (pipe(outpipe) != 0) {
      ::close(inpipe[0]);
      ::close(inpipe[1]);
      throw EngineError("pipe() failed for " + exePath);
    }

    std::fflush(nullptr);
    pid = fork();
    if (pid == -1) {
      ::close(inpipe[0]); ::close(inpipe[1]);
      ::close(outpipe[0]); ::close(outpipe[1]);
      throw EngineError("fork() failed for " + exePath);
    }

    if (pid == 0) {
      dup2(inpipe[0], STDIN_FILENO);
      dup2(outpipe[1], STDOUT_FILENO);
      dup2(outpipe[1], STDERR_FILENO);
      ::close(inpipe[0]); ::close(inpipe[1]);
      ::close(outpipe[0]); ::close(outpipe[1]);
      execl(exePath.c_str(), exePath.c_str(), (char*)nullptr);
      _exit(127);
    }

    ::close(inpipe[0]);
    ::close(outpipe[1]);

    fout = fdopen(inpipe[1], "w");
    fin = fdopen(outpipe[0], "r");
    if (!fin || !fout) throw EngineError("fdopen failed for " + exePath);

    setvbuf(fout, nullptr, _IONBF, 0);
  }

  [[noreturn]] void fail(const std::string& what) {
    dead = true;
    throw EngineError(what);
  }

  void sendln(const std::string& s) {
    if (dead || !fout) fail("UCI engine is not running: " + exePath);
    if (std::fputs(s.c_str(), fout) == EOF || std::fputc('\n', fout) == EOF ||
        std::fflush(fout) == EOF)
      fail("UCI engine stdin closed (" + exePath + ")");
  }

  std::optional<std::string> readline() {
    if (!fin) return std::nullopt;
    std::string line;
    char buf[4096];
    while (std::fgets(buf, sizeof(buf), fin)) {
      line += buf;
      if (!line.empty() && line.back() == '\n') return trim_crlf(std::move(line));
    }
    if (!line.empty()) return trim_crlf(std::move(line));
    return std::nullopt;
  }

  void isready() {
    sendln("isready");
    for (;;) {
      auto l = readline();
      if (!l) fail("UCI engine closed during isready (" + exePath + ")");
      if (*l == "readyok") return;
    }
  }

  void uci_handshake() {
    sendln("uci");
    for (;;) {
      auto l = readline();
      if (!l) fail("UCI engine closed during uci handshake (" + exePath + ")");
      if (*l == "uciok") break;
    }
    isready();
  }

  void start() {
    if (exePath.empty()) throw EngineError("UCI engine path is empty");
    spawn();
    uci_handshake();
  }

  void apply_options(const EngineOptions& opts) {
    if (opts.threads > 0) sendln("setoption name Threads value " + std::to_string(opts.threads));
    if (opts.hashMb > 0) sendln("setoption name Hash value " + std::to_string(opts.hashMb));
    isready();
  }

  EvalScore analyse(const std::vector<std::string>& moves, int depth) {
    {
      std::ostringstream os;
      os << "position startpos";
      if (!moves.empty()) {
        os << " moves";
        for (const auto& m : moves) os << ' ' << m;
      }
      sendln(os.str());
    }
    sendln("go depth " + std::to_string(std::max(1, depth)));

    EvalScore last = EvalScore::unknown();
    for (;;) {
      auto optLine = readline();
      if (!optLine) fail("UCI engine closed during search (" + exePath + ")");
      const std::string& line = *optLine;
      if (line.empty()) continue;

      if (starts_with(line, "info ")) {
        if (auto s = UciEngine::parse_info_score(line)) last = *s;
        continue;
      }
      if (line == "bestmove" || starts_with(line, "bestmove ")) return last;
    }
  }

  void terminate() noexcept {
    if (fout && !dead) {
      std::fputs("quit\n", fout);
      std::fflush(fout);
    }
    // EOF on stdin also makes well-behaved engines exit.
    if (fout) { std::fclose(fout); fout = nullptr; }

    if (pid > 0) {
      // Wait briefly, then SIGTERM, then SIGKILL.
      for (int i = 0; i < 10; ++i) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || r == -1) { pid = -1; break; }
        usleep(50 * 1000);
      }
      if (pid > 0) {
        kill(pid, SIGTERM);
        for (int i = 0; i < 10; ++i) {
          int status = 0;
          pid_t r = waitpid(pid, &status, WNOHANG);
          if (r == pid || r == -1) { pid = -1; break; }
          usleep(50 * 1000);
        }
      }
      if (pid > 0) {
        kill(pid, SIGKILL);
        int status = 0;
        waitpid(pid, &status, 0);
        pid = -1;
      }
    }

    if (fin) { std::fclose(fin); fin = nullptr; }
    dead = true;
  }
};

std::optional<EvalScore> UciEngine::parse_info_score(const std::string& line) {
  if (!starts_with(line, "info ") || starts_with(line, "info string")) return std::nullopt;

  const auto tok = split_ws(line);
  std::optional<EvalScore> score;
  int multipv = 1;
  for (std::size_t i = 1; i < tok.size(); ++i) {
    if (tok[i] == "multipv" && i + 1 < tok.size()) {
      multipv = to_int(tok[i + 1]).value_or(1);
    } else if (tok[i] == "score" && i + 2 < tok.size()) {
      const auto v = to_int(tok[i + 2]);
      if (!v) return std::nullopt;
      if (tok[i + 1] == "cp") score = EvalScore::centipawns(*v);
      else if (tok[i + 1] == "mate") score = EvalScore::mate_in(*v);
    } else if (tok[i] == "pv") {
      break;
    }
  }
  if (multipv != 1) return std::nullopt;
  return score;
}

UciEngine::UciEngine(const std::string& exePath) {
  auto* p = new Impl(exePath);
  try {
    p->start();
  } catch (...) {
    p->terminate();
    delete p;
    throw;
  }
  impl_ = p;
}

UciEngine::~UciEngine() { close(); }

void UciEngine::configure(const EngineOptions& opts) {
  if (!impl_) throw EngineError("UCI engine is closed");
  impl_->apply_options(opts);
}

EvalScore UciEngine::analyse(const std::vector<std::string>& moves, int depth) {
  if (!impl_) throw EngineError("UCI engine is closed");
  return impl_->analyse(moves, depth);
}

void UciEngine::close() noexcept {
  if (impl_) {
    impl_->terminate();
    delete impl_;
    impl_ = nullptr;
  }
}

}  // namespace moveeval::engine
