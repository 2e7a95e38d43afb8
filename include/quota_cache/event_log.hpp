#pragma once

#include "quota_cache/types.hpp"

#include <cstdint>
#include <deque>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace quota_cache {

enum class LogLevel { Debug, Info, Warn, Error };

const char *log_level_name(LogLevel level);

struct LogEvent {
  std::uint64_t ts_ms{0};
  LogLevel level{LogLevel::Info};
  std::string message;
};

struct TraceConfig {
  bool enabled{false};
  std::string path{"trace/quota_cache.trace.jsonl"};
  double sample_rate{1.0};
};

// Bounded ring of recent events. Warnings and errors are echoed to `echo`
// when one is given. Fetch outcomes may also be appended to a sampled JSONL
// trace file.
class EventLog {
public:
  explicit EventLog(std::size_t capacity = 256, std::ostream *echo = nullptr,
                    LogLevel min_level = LogLevel::Info);

  void log(LogLevel level, const std::string &message,
           WallClock::time_point ts = WallClock::now());
  std::vector<LogEvent> recent(std::size_t n) const;
  std::size_t size() const;
  std::uint64_t count(LogLevel level) const;
  void clear();

  bool configure_trace(const TraceConfig &cfg, std::string *err = nullptr);
  void trace(const std::string &json_line);
  std::uint64_t trace_dropped() const;
  std::uint64_t trace_written() const;

private:
  std::size_t capacity_;
  std::ostream *echo_;
  LogLevel min_level_;
  mutable std::mutex mu_;
  std::deque<LogEvent> ring_;
  std::uint64_t counts_[4]{0, 0, 0, 0};

  TraceConfig trace_cfg_;
  std::ofstream trace_stream_;
  std::mt19937_64 rng_{424242};
  std::uniform_real_distribution<double> sample_dist_{0.0, 1.0};
  std::uint64_t trace_dropped_{0};
  std::uint64_t trace_written_{0};
};

std::string json_escape(const std::string &s);

} // namespace quota_cache
