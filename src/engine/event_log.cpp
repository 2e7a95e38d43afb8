#include "quota_cache/event_log.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace quota_cache {

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "unknown";
}

EventLog::EventLog(std::size_t capacity, std::ostream *echo,
                   LogLevel min_level)
    : capacity_(std::max<std::size_t>(1, capacity)), echo_(echo),
      min_level_(min_level) {}

void EventLog::log(LogLevel level, const std::string &message,
                   WallClock::time_point ts) {
  if (level < min_level_)
    return;
  const auto ts_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          ts.time_since_epoch())
          .count());
  std::lock_guard<std::mutex> lk(mu_);
  ++counts_[static_cast<int>(level)];
  ring_.push_back({ts_ms, level, message});
  if (ring_.size() > capacity_)
    ring_.pop_front();
  if (echo_ && level >= LogLevel::Warn)
    *echo_ << "[" << log_level_name(level) << "] " << message << "\n";
}

std::vector<LogEvent> EventLog::recent(std::size_t n) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto take = std::min(n, ring_.size());
  return std::vector<LogEvent>(ring_.end() - static_cast<std::ptrdiff_t>(take),
                               ring_.end());
}

std::size_t EventLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return ring_.size();
}

std::uint64_t EventLog::count(LogLevel level) const {
  std::lock_guard<std::mutex> lk(mu_);
  return counts_[static_cast<int>(level)];
}

void EventLog::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  ring_.clear();
}

bool EventLog::configure_trace(const TraceConfig &cfg, std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (trace_stream_.is_open())
    trace_stream_.close();
  trace_cfg_ = cfg;
  trace_cfg_.sample_rate = std::clamp(cfg.sample_rate, 0.0, 1.0);
  if (!trace_cfg_.enabled)
    return true;
  trace_stream_.open(trace_cfg_.path, std::ios::app);
  if (!trace_stream_.is_open()) {
    trace_cfg_.enabled = false;
    if (err)
      *err = "cannot open trace file " + cfg.path;
    return false;
  }
  return true;
}

void EventLog::trace(const std::string &json_line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!trace_cfg_.enabled)
    return;
  if (sample_dist_(rng_) > trace_cfg_.sample_rate)
    return;
  if (!trace_stream_.is_open()) {
    ++trace_dropped_;
    return;
  }
  trace_stream_ << json_line << "\n";
  trace_stream_.flush();
  ++trace_written_;
}

std::uint64_t EventLog::trace_dropped() const {
  std::lock_guard<std::mutex> lk(mu_);
  return trace_dropped_;
}

std::uint64_t EventLog::trace_written() const {
  std::lock_guard<std::mutex> lk(mu_);
  return trace_written_;
}

std::string json_escape(const std::string &s) {
  std::ostringstream os;
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      os << "\\\"";
      break;
    case '\\':
      os << "\\\\";
      break;
    case '\n':
      os << "\\n";
      break;
    case '\r':
      os << "\\r";
      break;
    case '\t':
      os << "\\t";
      break;
    default:
      if (c < 0x20)
        os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(c) << std::dec;
      else
        os << c;
    }
  }
  return os.str();
}

} // namespace quota_cache
