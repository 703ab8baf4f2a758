#include "moveeval/parallel_coordinator.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "moveeval/errors.hpp"
#include "moveeval/progress.hpp"
#include "moveeval/shard_planner.hpp"

namespace moveeval {

namespace {

std::string describe_status(int status) {
  if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
  return "status " + std::to_string(status);
}

bool succeeded(int status) { return WIFEXITED(status) && WEXITSTATUS(status) == 0; }

[[noreturn]] void run_child(const ShardJob& job, const engine::EngineFactory& factory,
                            const SessionSettings& settings) {
  int code = 0;
  try {
    run_shard_worker(job, factory, settings);
  } catch (const std::exception& ex) {
    std::cerr << "Shard " << job.index << " failed: " << ex.what() << "\n";
    code = 1;
  }
  std::cout.flush();
  std::cerr.flush();
  std::fflush(nullptr);
  _exit(code);
}

void stop_workers(std::map<pid_t, std::size_t>& running) {
  for (const auto& entry : running) ::kill(entry.first, SIGTERM);
  for (const auto& entry : running) {
    int status = 0;
    while (::waitpid(entry.first, &status, 0) < 0 && errno == EINTR) {
    }
  }
  running.clear();
}

}  // namespace

void remove_part_files(const fs::path& output) {
  const fs::path dir = output.has_parent_path() ? output.parent_path() : fs::path(".");
  const std::string prefix = output.stem().string() + ".part-";
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return;

  std::vector<fs::path> doomed;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind(prefix, 0) == 0) doomed.push_back(entry.path());
  }
  for (const auto& p : doomed) fs::remove(p, ec);
}

void merge_parts(const fs::path& output, const std::vector<fs::path>& parts) {
  if (output.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(output.parent_path(), ec);
  }
  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("Unable to write output: " + output.string());

  char buf[1 << 16];
  for (const auto& part : parts) {
    std::ifstream in(part, std::ios::binary);
    if (!in) throw std::runtime_error("Missing part output: " + part.string());
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) out.write(buf, in.gcount());
  }
  out.close();
  if (!out) throw std::runtime_error("Failed writing merged output: " + output.string());
}

ParallelCoordinator::ParallelCoordinator(engine::EngineFactory factory, SessionSettings settings)
    : factory_(std::move(factory)), settings_(std::move(settings)) {}

EvaluationStats ParallelCoordinator::run(const ParallelSettings& ps) {
  reused_.clear();
  launched_.clear();

  const ShardPlan plan = prepare_shards(ps.inputPath, ps.shardDir, ps.workers, ps.maxGames);
  std::cout << (plan.reused ? "Reusing" : "Wrote") << " shard manifest "
            << manifest_path(ps.shardDir).string() << " (" << plan.manifest.totalLines
            << " games, " << plan.manifest.workers << " shards)\n";

  // Parts from an older partition describe different shard contents.
  if (!plan.reused) remove_part_files(ps.outputPath);

  EvaluationStats total;
  std::vector<ShardJob> pending;
  std::vector<fs::path> parts;
  for (std::size_t i = 0; i < plan.manifest.shardPaths.size(); ++i) {
    ShardJob job;
    job.index = i;
    job.shardPath = plan.manifest.shardPaths[i];
    job.partPath = part_output_path(ps.outputPath, i);
    job.metaPath = part_meta_path(job.partPath);
    parts.push_back(job.partPath);

    std::error_code ec;
    if (fs::exists(job.partPath, ec) && fs::exists(job.metaPath, ec)) {
      const auto meta = read_part_metadata(job.metaPath);
      if (meta && meta->engine == settings_.engine) {
        total += meta->stats;
        reused_.push_back(i);
        continue;
      }
    }
    // Metadata marks completion, so it must not outlive a relaunch.
    fs::remove(job.metaPath, ec);
    pending.push_back(std::move(job));
  }

  if (!reused_.empty())
    std::cout << "Reusing " << reused_.size() << " completed shard(s)\n";

  if (!pending.empty()) run_jobs(pending, ps.workers, total);

  std::error_code ec;
  if (!fs::exists(ps.outputPath, ec)) {
    merge_parts(ps.outputPath, parts);
  } else {
    std::cout << "Keeping existing " << ps.outputPath.string() << "\n";
  }
  return total;
}

void ParallelCoordinator::run_jobs(const std::vector<ShardJob>& jobs, int workers,
                                   EvaluationStats& total) {
  ProgressMeter progress("shards", jobs.size(), std::cout);
  std::map<pid_t, std::size_t> running;  // pid -> position in jobs
  std::optional<std::string> failure;   // first failed shard
  std::size_t next = 0;

  // After a failure nothing new is dispatched, but in-flight shards finish.
  while (!running.empty() || (!failure && next < jobs.size())) {
    while (!failure && next < jobs.size() &&
           running.size() < static_cast<std::size_t>(workers)) {
      const ShardJob& job = jobs[next];
      std::cout.flush();
      std::cerr.flush();
      std::fflush(nullptr);

      const pid_t pid = ::fork();
      if (pid < 0) {
        stop_workers(running);
        throw ShardFailure("Unable to start worker for shard " + std::to_string(job.index));
      }
      if (pid == 0) run_child(job, factory_, settings_);

      running.emplace(pid, next);
      launched_.push_back(job.index);
      ++next;
    }

    int status = 0;
    const pid_t pid = ::waitpid(-1, &status, 0);
    if (pid < 0) {
      if (errno == EINTR) continue;
      stop_workers(running);
      throw ShardFailure("Lost track of shard workers");
    }
    auto it = running.find(pid);
    if (it == running.end()) continue;

    const ShardJob& job = jobs[it->second];
    running.erase(it);

    if (!succeeded(status)) {
      if (!failure)
        failure = "Shard " + std::to_string(job.index) + " (" + job.shardPath.string() +
                  ") failed with " + describe_status(status);
      continue;
    }

    const auto meta = read_part_metadata(job.metaPath);
    if (!meta) {
      if (!failure)
        failure = "Shard " + std::to_string(job.index) + " left no valid metadata at " +
                  job.metaPath.string();
      continue;
    }
    total += meta->stats;
    progress.add();
  }
  progress.finish();
  if (failure) throw ShardFailure(*failure);
}

}  // namespace moveeval
