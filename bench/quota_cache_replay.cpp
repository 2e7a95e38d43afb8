#include "quota_cache/config.hpp"
#include "quota_cache/fingerprint.hpp"
#include "quota_cache/orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using namespace quota_cache;

namespace {
struct TraceQuery {
  std::uint64_t ts_ms{0};
  std::string family;
  QueryParams params;
};

bool extract_u64(const std::string &line, const std::string &key, std::uint64_t &out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(line, m, re)) return false;
  out = std::stoull(m[1].str());
  return true;
}

bool extract_str(const std::string &line, const std::string &key, std::string &out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"([^\\\"]*)\\\"");
  std::smatch m;
  if (!std::regex_search(line, m, re)) return false;
  out = m[1].str();
  return true;
}

QueryParams extract_params(const std::string &line) {
  QueryParams out;
  static const std::regex obj_re("\\\"params\\\"\\s*:\\s*\\{([^}]*)\\}");
  static const std::regex kv_re("\\\"([^\\\"]+)\\\"\\s*:\\s*(?:\\\"([^\\\"]*)\\\"|([0-9]+))");
  std::smatch m;
  if (!std::regex_search(line, m, obj_re)) return out;
  const std::string body = m[1].str();
  for (auto it = std::sregex_iterator(body.begin(), body.end(), kv_re); it != std::sregex_iterator(); ++it) {
    const auto &kv = *it;
    out[kv[1].str()] = kv[2].matched ? kv[2].str() : kv[3].str();
  }
  return out;
}

// Stand-in for the remote API: fixture ids hash to a stable match state and
// a configurable share of calls fail.
class SimulatedUpstream {
public:
  SimulatedUpstream(double quota_rate, double fail_rate, std::uint64_t seed)
      : quota_rate_(quota_rate), fail_rate_(fail_rate), rng_(seed) {}

  UpstreamResponse operator()(const std::string &f, const QueryParams &params) {
    ++calls_;
    const double roll = dist_(rng_);
    if (roll < quota_rate_) return UpstreamResponse::quota_error(std::chrono::seconds(30));
    if (roll < quota_rate_ + fail_rate_) return UpstreamResponse::transport_error("simulated timeout");
    if (f != family::kFixtures && f != family::kHeadToHead) return UpstreamResponse::ok(R"({"results":1,"response":[{"id":1}]})");

    const auto canonical = canonical_query(f, params);
    std::string short_status = "NS";
    std::string long_status = "Not Started";
    if (params.count("live")) {
      short_status = "2H";
      long_status = "Second Half";
    } else if (std::hash<std::string>{}(canonical) % 3 != 0) {
      short_status = "FT";
      long_status = "Match Finished";
    }
    return UpstreamResponse::ok(R"({"results":1,"response":[{"fixture":{"id":1,"status":{"long":")" + long_status +
                                R"(","short":")" + short_status + R"("}}}]})");
  }

  std::uint64_t calls() const { return calls_; }

private:
  double quota_rate_;
  double fail_rate_;
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> dist_{0.0, 1.0};
  std::uint64_t calls_{0};
};
} // namespace

int main(int argc, char **argv) {
  std::string trace_path = "traces/api_sports_day.jsonl";
  std::string config_path;
  std::string out_json = "out/replay_summary.json";
  double quota_rate = 0.0;
  double fail_rate = 0.0;
  std::uint64_t seed = 42;

  std::vector<std::string> args(argv + 1, argv + argc);
  MediatorConfig cfg;
  std::vector<std::string> rest;
  std::string err;
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "--config") config_path = args[i + 1];
  }
  if (!config_path.empty() && !load_config(config_path, cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 1;
  }
  if (!apply_cli_overrides(args, cfg, &err, &rest)) {
    std::cerr << "flags: " << err << "\n";
    return 1;
  }
  for (std::size_t i = 0; i < rest.size(); ++i) {
    const std::string &a = rest[i];
    if (a == "--trace-file" && i + 1 < rest.size()) trace_path = rest[++i];
    else if (a == "--json" && i + 1 < rest.size()) out_json = rest[++i];
    else if (a == "--quota-rate" && i + 1 < rest.size()) quota_rate = std::stod(rest[++i]);
    else if (a == "--fail-rate" && i + 1 < rest.size()) fail_rate = std::stod(rest[++i]);
    else if (a == "--seed" && i + 1 < rest.size()) seed = std::stoull(rest[++i]);
    else if (a == "--config" && i + 1 < rest.size()) ++i;
  }

  std::ifstream in(trace_path);
  if (!in.is_open()) {
    std::cerr << "trace file not found\n";
    return 1;
  }
  std::vector<TraceQuery> queries;
  for (std::string line; std::getline(in, line);) {
    TraceQuery q;
    extract_u64(line, "ts_ms", q.ts_ms);
    extract_str(line, "family", q.family);
    q.params = extract_params(line);
    if (!q.family.empty()) queries.push_back(std::move(q));
  }

  ManualTimeSource clock;
  EventLog log(1024, &std::cerr);
  if (!log.configure_trace(cfg.trace, &err)) std::cerr << "trace: " << err << "\n";
  ResultCache cache(cfg.cache, clock, make_policy_by_name(cfg.policy));
  RateLimiter limiter(cfg.limiter, clock);
  FetchOrchestrator orch(cfg.orchestrator, cache, limiter, clock, log);
  SimulatedUpstream sim(quota_rate, fail_rate, seed);
  UpstreamCall upstream = [&sim](const std::string &f, const QueryParams &p) { return sim(f, p); };

  std::uint64_t ok = 0;
  std::uint64_t quota = 0;
  std::uint64_t transport = 0;
  std::uint64_t other = 0;
  const auto start = clock.now();
  const std::uint64_t base_ts = queries.empty() ? 0 : queries.front().ts_ms;
  for (const auto &q : queries) {
    // Out-of-order lines replay at the current simulated time.
    const std::uint64_t offset = q.ts_ms > base_ts ? q.ts_ms - base_ts : 0;
    const auto target = start + Duration(static_cast<Duration::rep>(offset));
    if (target > clock.now()) clock.set(target);
    cache.purge_expired(64);
    const auto r = orch.fetch(q.family, q.params, upstream);
    if (r.ok()) ++ok;
    else if (r.status == FetchStatus::QuotaExhausted) ++quota;
    else if (r.status == FetchStatus::TransportFailure) ++transport;
    else ++other;
  }

  const auto os = orch.stats();
  const auto ls = limiter.stats();
  const auto remaining = limiter.remaining();
  const double simulated_s = std::chrono::duration<double>(clock.now() - start).count();

  const auto out_dir = std::filesystem::path(out_json).parent_path();
  std::error_code ec;
  if (!out_dir.empty())
    std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "cannot create " << out_dir.string() << ": " << ec.message()
              << "\n";
    return 1;
  }
  std::ofstream jout(out_json);
  if (!jout.is_open()) {
    std::cerr << "cannot write " << out_json << "\n";
    return 1;
  }
  jout << "{\n";
  jout << "  \"trace\": \"" << json_escape(trace_path) << "\",\n";
  jout << "  \"queries\": " << queries.size() << ",\n";
  jout << "  \"ok\": " << ok << ",\n";
  jout << "  \"quota_exhausted\": " << quota << ",\n";
  jout << "  \"transport_failure\": " << transport << ",\n";
  jout << "  \"other_failure\": " << other << ",\n";
  jout << "  \"upstream_calls\": " << sim.calls() << ",\n";
  jout << "  \"cache_hit_rate\": " << cache.hit_rate() << ",\n";
  jout << "  \"admission_waits\": " << os.admission_waits << ",\n";
  jout << "  \"rejections\": " << ls.rejections << ",\n";
  jout << "  \"remaining_minute\": " << remaining.minute << ",\n";
  jout << "  \"remaining_day\": " << remaining.day << ",\n";
  jout << "  \"simulated_seconds\": " << simulated_s << "\n";
  jout << "}\n";

  std::cout << "queries=" << queries.size() << " ok=" << ok << " quota=" << quota << " transport=" << transport
            << " upstream_calls=" << sim.calls() << " hit_rate=" << cache.hit_rate()
            << " simulated_s=" << simulated_s << "\n";
  std::cout << "INFO\n" << orch.info() << "\n";
  return 0;
}
