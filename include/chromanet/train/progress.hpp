#pragma once
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace chromanet::train {

// Single-line epoch progress meter ("\r" redraw). A null stream makes it silent.
class ProgressMeter {
 public:
  ProgressMeter(std::ostream* out, std::string label, std::size_t total, int intervalMs = 750)
      : out_(out),
        label_(std::move(label)),
        total_(total),
        intervalMs_(intervalMs),
        start_(std::chrono::steady_clock::now()),
        last_(start_) {}

  ProgressMeter(const ProgressMeter&) = delete;
  ProgressMeter& operator=(const ProgressMeter&) = delete;

  ~ProgressMeter() { finish(); }

  void update(std::size_t value) {
    if (finished_) return;
    current_ = value < total_ ? value : total_;
    draw(false);
  }

  void set_status(std::string s) { status_ = std::move(s); }

  // Ends the line, leaving the count where training stopped.
  void finish() {
    if (finished_) return;
    draw(true);
    finished_ = true;
    if (out_) *out_ << "\n";
  }

 private:
  std::ostream* out_;
  std::string label_;
  std::size_t total_{0};
  std::size_t current_{0};
  int intervalMs_{750};
  bool finished_{false};
  std::string status_;

  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_;

  static std::string fmt_hms(std::chrono::seconds s) {
    long long t = s.count();
    const int h = static_cast<int>(t / 3600);
    const int m = static_cast<int>((t % 3600) / 60);
    const int sec = static_cast<int>(t % 60);
    std::ostringstream os;
    if (h > 0)
      os << h << ":" << std::setw(2) << std::setfill('0') << m << ":" << std::setw(2) << sec;
    else
      os << m << ":" << std::setw(2) << std::setfill('0') << sec;
    return os.str();
  }

  void draw(bool force) {
    if (!out_) return;
    const auto now = std::chrono::steady_clock::now();
    const auto sinceMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_).count();
    if (!force && sinceMs < intervalMs_) return;
    last_ = now;

    const double pct = total_ ? (100.0 * double(current_) / double(total_)) : 0.0;
    const double elapsedSec = std::chrono::duration<double>(now - start_).count();
    const double rate = elapsedSec > 0.0 ? double(current_) / elapsedSec : 0.0;
    const double remainSec = rate > 0.0 ? double(total_ - current_) / rate : 0.0;

    std::ostringstream line;
    line << "\r" << label_ << " " << std::fixed << std::setprecision(1) << pct << "% "
         << "(" << current_ << "/" << total_ << ")  "
         << "elapsed " << fmt_hms(std::chrono::seconds(static_cast<long long>(elapsedSec + 0.5)))
         << "  ETA ~" << fmt_hms(std::chrono::seconds(static_cast<long long>(remainSec + 0.5)));
    if (rate > 0.0) line << "  rate " << std::setprecision(1) << rate << "/s";
    if (!status_.empty()) line << "  " << status_;
    *out_ << line.str() << std::flush;
  }
};

}  // namespace chromanet::train
