#pragma once
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace moveeval {

// Single-line "\r" progress meter for the coordinator's dispatch loop.
class ProgressMeter {
 public:
  ProgressMeter(std::string label, std::size_t total, std::ostream& os = std::cout,
                int intervalMs = 500)
      : label_(std::move(label)),
        total_(total),
        os_(os),
        intervalMs_(intervalMs),
        start_(std::chrono::steady_clock::now()),
        last_(start_) {}

  void add(std::size_t delta = 1) {
    if (finished_) return;
    current_ += delta;
    tick(false);
  }

  void finish() {
    if (finished_) return;
    tick(true);
    finished_ = true;
    os_ << "\n" << std::flush;
  }

 private:
  std::string label_;
  std::size_t total_{0};
  std::size_t current_{0};
  std::ostream& os_;
  int intervalMs_{500};
  bool finished_{false};

  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_;

  static std::string fmt_hms(std::chrono::seconds s) {
    const long t = static_cast<long>(s.count());
    const int h = static_cast<int>(t / 3600);
    const int m = static_cast<int>((t % 3600) / 60);
    const int sec = static_cast<int>(t % 60);
    std::ostringstream os;
    if (h > 0) os << h << ":" << std::setw(2) << std::setfill('0') << m << ":";
    else os << m << ":";
    os << std::setw(2) << std::setfill('0') << sec;
    return os.str();
  }

  void tick(bool force) {
    const auto now = std::chrono::steady_clock::now();
    const auto sinceMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_).count();
    const std::size_t cur = current_ > total_ ? total_ : current_;
    if (!force && sinceMs < intervalMs_ && cur != total_) return;
    last_ = now;

    const double pct = total_ ? (100.0 * double(cur) / double(total_)) : 100.0;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_);

    std::ostringstream line;
    line << "\r" << label_ << " " << std::fixed << std::setprecision(1) << pct << "% (" << cur
         << "/" << total_ << ")  elapsed " << fmt_hms(elapsed);
    os_ << line.str() << std::flush;
  }
};

}  // namespace moveeval
