#include "quota_cache/config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace quota_cache {
namespace {
bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = std::stod(m[1].str());
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

std::uint64_t clamp_u(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
double clamp_d(double v, double lo, double hi) {
  return std::min(hi, std::max(lo, v));
}
Duration from_seconds(double s) {
  return std::chrono::duration_cast<Duration>(
      std::chrono::duration<double>(s));
}
bool known_policy(const std::string &name) {
  return name == "lru" || name == "lfu";
}
} // namespace

bool parse_config_text(const std::string &text, MediatorConfig &cfg,
                       std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  MediatorConfig next = cfg;
  double d;
  std::uint64_t u;
  std::string s;
  bool b;
  try {
    if (extract_u64(text, "rate_limit_calls_per_minute", u))
      next.limiter.calls_per_minute = clamp_u(u, 1, 100000);
    if (extract_u64(text, "rate_limit_calls_per_day", u))
      next.limiter.calls_per_day = clamp_u(u, 1, 100000000);
    if (extract_double(text, "rate_limit_max_wait_s", d))
      next.limiter.max_wait = from_seconds(clamp_d(d, 0.0, 7 * 86400.0));
    if (extract_double(text, "rate_limit_day_exhausted_hint_s", d))
      next.limiter.day_exhausted_hint =
          from_seconds(clamp_d(d, 120.0, 86400.0));
    if (extract_double(text, "rate_limit_backoff_factor", d))
      next.limiter.backoff_base = from_seconds(clamp_d(d, 0.001, 3600.0));
    if (extract_double(text, "rate_limit_backoff_max_s", d))
      next.limiter.backoff_max = from_seconds(clamp_d(d, 0.001, 86400.0));
    if (extract_double(text, "rate_limit_jitter", d))
      next.limiter.jitter_ratio = clamp_d(d, 0.0, 0.5);
    if (extract_u64(text, "rate_limit_max_retries", u))
      next.orchestrator.transport_max_attempts =
          static_cast<std::uint32_t>(clamp_u(u, 1, 20));
    if (extract_double(text, "transport_backoff_base_s", d))
      next.orchestrator.transport_backoff_base =
          from_seconds(clamp_d(d, 0.0, 3600.0));
    if (extract_u64(text, "max_admission_attempts", u))
      next.orchestrator.max_admission_attempts =
          static_cast<std::uint32_t>(clamp_u(u, 1, 1000));
    if (extract_double(text, "max_total_wait_s", d))
      next.orchestrator.max_total_wait =
          from_seconds(clamp_d(d, 0.0, 7 * 86400.0));
    if (extract_double(text, "follower_max_wait_s", d))
      next.orchestrator.follower_max_wait =
          from_seconds(clamp_d(d, 0.01, 7 * 86400.0));

    if (extract_bool(text, "cache_enabled", b))
      next.cache.enabled = b;
    if (extract_u64(text, "cache_max_size", u))
      next.cache.max_entries =
          static_cast<std::size_t>(clamp_u(u, 1, 10000000));
    if (extract_u64(text, "cache_max_payload_bytes", u))
      next.cache.max_payload_bytes =
          static_cast<std::size_t>(clamp_u(u, 1, 1ULL << 30));
    if (extract_u64(text, "cache_ttl_teams", u))
      next.cache.ttl.long_ttl = std::chrono::seconds(clamp_u(u, 1, 30 * 86400));
    if (extract_u64(text, "cache_ttl_fixtures_upcoming", u))
      next.cache.ttl.medium_ttl =
          std::chrono::seconds(clamp_u(u, 1, 30 * 86400));
    if (extract_u64(text, "cache_ttl_standings", u))
      next.cache.ttl.short_ttl =
          std::chrono::seconds(clamp_u(u, 1, 30 * 86400));
    if (extract_string(text, "cache_policy", s)) {
      if (!known_policy(s)) {
        if (err)
          *err = "unknown cache_policy " + s;
        return false;
      }
      next.policy = s;
    }

    if (extract_bool(text, "trace_enabled", b))
      next.trace.enabled = b;
    if (extract_string(text, "trace_path", s))
      next.trace.path = s;
    if (extract_double(text, "trace_sample_rate", d))
      next.trace.sample_rate = clamp_d(d, 0.0, 1.0);
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric value out of range";
    return false;
  } catch (const std::invalid_argument &) {
    if (err)
      *err = "malformed numeric value";
    return false;
  }

  next.orchestrator.cache_enabled = next.cache.enabled;
  cfg = next;
  return true;
}

bool load_config(const std::string &path, MediatorConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config_text(ss.str(), cfg, err);
}

bool apply_cli_overrides(const std::vector<std::string> &args,
                         MediatorConfig &cfg, std::string *err,
                         std::vector<std::string> *unused) {
  MediatorConfig next = cfg;
  try {
    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string &a = args[i];
      const bool has_value = i + 1 < args.size();
      if (a == "--calls-per-minute" && has_value)
        next.limiter.calls_per_minute =
            clamp_u(std::stoull(args[++i]), 1, 100000);
      else if (a == "--calls-per-day" && has_value)
        next.limiter.calls_per_day =
            clamp_u(std::stoull(args[++i]), 1, 100000000);
      else if (a == "--cache-max" && has_value)
        next.cache.max_entries = static_cast<std::size_t>(
            clamp_u(std::stoull(args[++i]), 1, 10000000));
      else if (a == "--max-wait" && has_value)
        next.orchestrator.max_total_wait =
            from_seconds(clamp_d(std::stod(args[++i]), 0.0, 7 * 86400.0));
      else if (a == "--policy" && has_value) {
        const std::string &name = args[++i];
        if (!known_policy(name)) {
          if (err)
            *err = "unknown policy " + name;
          return false;
        }
        next.policy = name;
      } else if (a == "--no-cache")
        next.cache.enabled = false;
      else if (a == "--trace" && has_value) {
        next.trace.enabled = true;
        next.trace.path = args[++i];
      } else if (unused)
        unused->push_back(a);
    }
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric flag out of range";
    return false;
  } catch (const std::invalid_argument &) {
    if (err)
      *err = "malformed numeric flag";
    return false;
  }
  next.orchestrator.cache_enabled = next.cache.enabled;
  cfg = next;
  return true;
}

std::string describe(const MediatorConfig &cfg) {
  std::ostringstream os;
  os << "calls_per_minute:" << cfg.limiter.calls_per_minute << "\n";
  os << "calls_per_day:" << cfg.limiter.calls_per_day << "\n";
  os << "backoff_base_ms:" << cfg.limiter.backoff_base.count() << "\n";
  os << "backoff_max_ms:" << cfg.limiter.backoff_max.count() << "\n";
  os << "cache_enabled:" << (cfg.cache.enabled ? 1 : 0) << "\n";
  os << "cache_max_entries:" << cfg.cache.max_entries << "\n";
  os << "cache_policy:" << cfg.policy << "\n";
  os << "ttl_long_s:" << cfg.cache.ttl.long_ttl.count() << "\n";
  os << "ttl_medium_s:" << cfg.cache.ttl.medium_ttl.count() << "\n";
  os << "ttl_short_s:" << cfg.cache.ttl.short_ttl.count() << "\n";
  os << "transport_max_attempts:" << cfg.orchestrator.transport_max_attempts
     << "\n";
  os << "max_total_wait_ms:" << cfg.orchestrator.max_total_wait.count()
     << "\n";
  os << "trace_enabled:" << (cfg.trace.enabled ? 1 : 0) << "\n";
  return os.str();
}

} // namespace quota_cache
