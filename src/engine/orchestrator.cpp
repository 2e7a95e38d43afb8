#include "quota_cache/orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace quota_cache {
namespace {
std::string ms_text(Duration d) { return std::to_string(d.count()) + "ms"; }
} // namespace

const char *fetch_status_name(FetchStatus s) {
  switch (s) {
  case FetchStatus::Ok:
    return "ok";
  case FetchStatus::QuotaExhausted:
    return "quota_exhausted";
  case FetchStatus::TransportFailure:
    return "transport_failure";
  case FetchStatus::UpstreamError:
    return "upstream_error";
  case FetchStatus::InternalInvariantViolation:
    return "internal_invariant_violation";
  case FetchStatus::Cancelled:
    return "cancelled";
  case FetchStatus::InvalidQuery:
    return "invalid_query";
  }
  return "unknown";
}

bool is_retryable(FetchStatus s) {
  return s == FetchStatus::QuotaExhausted ||
         s == FetchStatus::TransportFailure;
}

FetchOrchestrator::FetchOrchestrator(OrchestratorConfig cfg,
                                     ResultCache &cache, RateLimiter &limiter,
                                     TimeSource &time, EventLog &log)
    : cfg_(std::move(cfg)), cache_(cache), limiter_(limiter), time_(time),
      log_(log) {
  cfg_.transport_max_attempts = std::max<std::uint32_t>(1, cfg_.transport_max_attempts);
  cfg_.max_admission_attempts = std::max<std::uint32_t>(1, cfg_.max_admission_attempts);
  cfg_.follower_poll = std::max(cfg_.follower_poll, Duration(1));
  cfg_.follower_max_wait = std::max(cfg_.follower_max_wait, cfg_.follower_poll);
}

FetchResult FetchOrchestrator::fetch(const std::string &family,
                                     const QueryParams &params,
                                     const UpstreamCall &upstream,
                                     const CancellationToken &cancel) {
  bump(&OrchestratorStats::fetches);
  const Fingerprint fp = make_fingerprint(family, params);
  const bool use_cache = cfg_.cache_enabled && cache_.enabled();

  if (use_cache) {
    bool collision = false;
    auto hit = cache_.lookup(fp, &collision);
    if (collision) {
      log_.log(LogLevel::Error, "fingerprint collision on " + fp.key +
                                    " for " + fp.canonical,
               time_.wall_now());
      return finish(fp, FetchResult::failure(
                            FetchStatus::InternalInvariantViolation,
                            "fingerprint collision on " + fp.key));
    }
    if (hit.has_value()) {
      bump(&OrchestratorStats::cache_hits);
      FetchResult r;
      r.payload = std::move(hit->payload);
      r.ttl_class = hit->ttl_class;
      r.from_cache = true;
      return finish(fp, std::move(r));
    }
  }

  std::shared_ptr<Flight> flight;
  bool leader = false;
  {
    std::lock_guard<std::mutex> lk(flights_mu_);
    auto it = flights_.find(fp.key);
    if (it != flights_.end() && !it->second->abandoned &&
        !it->second->completed) {
      flight = it->second;
      ++flight->interest;
    } else {
      flight = std::make_shared<Flight>();
      flight->key = fp.key;
      flight->deadline = time_.now() + cfg_.max_total_wait;
      flight->result = flight->promise.get_future().share();
      flights_[fp.key] = flight;
      leader = true;
    }
  }

  if (!leader) {
    bump(&OrchestratorStats::dedup_joins);
    return await_follower(fp, params, upstream, flight, cancel);
  }
  return lead(fp, params, upstream, cancel, flight);
}

// Runs the flight's upstream work on the calling thread and publishes the
// outcome. The flight is completed on every path that does not hand it to
// another caller, exceptions included.
FetchResult FetchOrchestrator::lead(const Fingerprint &fp,
                                    const QueryParams &params,
                                    const UpstreamCall &upstream,
                                    const CancellationToken &cancel,
                                    const std::shared_ptr<Flight> &flight) {
  LeaderContext ctx{fp, params, upstream, cancel, flight, flight->deadline};
  FetchResult r;
  try {
    r = run_leader(ctx);
  } catch (...) {
    if (!ctx.handed_off)
      complete(*flight, FetchResult::failure(FetchStatus::TransportFailure,
                                             "in-flight fetch aborted"));
    throw;
  }

  if (ctx.withdrawn) {
    if (!ctx.handed_off)
      complete(*flight, r);
    bump(&OrchestratorStats::cancellations);
    return finish(fp, FetchResult::failure(FetchStatus::Cancelled,
                                           "fetch cancelled by caller"));
  }
  complete(*flight, r);
  return finish(fp, std::move(r));
}

FetchResult FetchOrchestrator::run_leader(LeaderContext &ctx) {
  // A fetch for the same key may have completed between our miss and our
  // registration as leader.
  if (cfg_.cache_enabled && cache_.enabled()) {
    bool collision = false;
    auto hit = cache_.lookup(ctx.fp, &collision);
    if (collision) {
      log_.log(LogLevel::Error, "fingerprint collision on " + ctx.fp.key +
                                    " for " + ctx.fp.canonical,
               time_.wall_now());
      return FetchResult::failure(FetchStatus::InternalInvariantViolation,
                                  "fingerprint collision on " + ctx.fp.key);
    }
    if (hit.has_value()) {
      bump(&OrchestratorStats::cache_hits);
      FetchResult r;
      r.payload = std::move(hit->payload);
      r.ttl_class = hit->ttl_class;
      r.from_cache = true;
      return r;
    }
  }

  std::uint32_t attempts = 0;
  Duration transport_delay = cfg_.transport_backoff_base;
  while (true) {
    if (auto failure = wait_admission(ctx)) {
      failure->upstream_attempts = attempts;
      return *failure;
    }

    ++attempts;
    bump(&OrchestratorStats::upstream_calls);
    UpstreamResponse resp = call_upstream(ctx);

    switch (resp.status) {
    case UpstreamStatus::Ok: {
      limiter_.record_outcome(true);
      FetchResult r;
      r.payload = std::move(resp.body);
      r.upstream_attempts = attempts;
      r.ttl_class = classify(ctx.fp.family, ctx.params, r.payload);
      if (cfg_.cache_enabled && cache_.enabled() &&
          r.ttl_class != TtlClass::None) {
        std::string err;
        if (!cache_.store(ctx.fp, r.payload, r.ttl_class, &err)) {
          const bool collision = err.rfind("fingerprint collision", 0) == 0;
          log_.log(collision ? LogLevel::Error : LogLevel::Warn,
                   "store " + ctx.fp.key + " failed: " + err,
                   time_.wall_now());
        }
      }
      log_.log(LogLevel::Debug,
               "fetched " + ctx.fp.canonical + " ttl=" +
                   ttl_class_name(r.ttl_class),
               time_.wall_now());
      return r;
    }
    case UpstreamStatus::QuotaError: {
      limiter_.record_outcome(false, resp.retry_after);
      std::string why = "upstream rejected call for quota";
      if (resp.retry_after.has_value())
        why += ", retry after " + ms_text(*resp.retry_after);
      log_.log(LogLevel::Warn, why + " (" + ctx.fp.canonical + ")",
               time_.wall_now());
      auto r = FetchResult::failure(FetchStatus::QuotaExhausted, why);
      r.upstream_attempts = attempts;
      return r;
    }
    case UpstreamStatus::UpstreamError: {
      limiter_.record_outcome(true);
      log_.log(LogLevel::Warn,
               "upstream error for " + ctx.fp.canonical + ": " + resp.error,
               time_.wall_now());
      auto r = FetchResult::failure(FetchStatus::UpstreamError, resp.error);
      r.upstream_attempts = attempts;
      return r;
    }
    case UpstreamStatus::TransportError:
      break;
    }

    log_.log(LogLevel::Warn,
             "transport failure " + std::to_string(attempts) + "/" +
                 std::to_string(cfg_.transport_max_attempts) + " for " +
                 ctx.fp.canonical + ": " + resp.error,
             time_.wall_now());
    if (attempts >= cfg_.transport_max_attempts) {
      auto r = FetchResult::failure(
          FetchStatus::TransportFailure,
          "transport failed after " + std::to_string(attempts) +
              " attempts: " + resp.error);
      r.upstream_attempts = attempts;
      return r;
    }
    if (time_.now() + transport_delay > ctx.deadline) {
      auto r = FetchResult::failure(
          FetchStatus::TransportFailure,
          "transport retry would exceed wait deadline: " + resp.error);
      r.upstream_attempts = attempts;
      return r;
    }
    bump(&OrchestratorStats::transport_retries);
    if (!suspend(ctx, transport_delay)) {
      auto r = FetchResult::failure(FetchStatus::Cancelled,
                                    "fetch cancelled by caller");
      r.upstream_attempts = attempts;
      return r;
    }
    transport_delay *= 2;
  }
}

// A transport that throws is treated as a failed call, so the retry budget
// and the flight's completion still apply.
UpstreamResponse FetchOrchestrator::call_upstream(LeaderContext &ctx) {
  try {
    return ctx.upstream(ctx.fp.family, ctx.params);
  } catch (const std::exception &e) {
    return UpstreamResponse::transport_error(std::string("upstream threw: ") +
                                             e.what());
  }
}

std::optional<FetchResult>
FetchOrchestrator::wait_admission(LeaderContext &ctx) {
  for (std::uint32_t attempt = 0; attempt < cfg_.max_admission_attempts;
       ++attempt) {
    note_leader_cancel(ctx);
    if (ctx.withdrawn)
      return FetchResult::failure(FetchStatus::Cancelled,
                                  "fetch cancelled by caller");

    const auto decision = limiter_.acquire();
    switch (decision.kind) {
    case AdmissionDecision::Kind::Admit:
      return std::nullopt;
    case AdmissionDecision::Kind::Reject:
      log_.log(LogLevel::Warn,
               "admission rejected for " + ctx.fp.canonical + ": " +
                   decision.reason,
               time_.wall_now());
      return FetchResult::failure(FetchStatus::QuotaExhausted,
                                  decision.reason);
    case AdmissionDecision::Kind::Wait:
      break;
    }

    if (time_.now() + decision.wait > ctx.deadline) {
      log_.log(LogLevel::Warn,
               "admission wait of " + ms_text(decision.wait) + " for " +
                   ctx.fp.canonical + " exceeds the wait deadline",
               time_.wall_now());
      return FetchResult::failure(FetchStatus::QuotaExhausted,
                                  "rate limited: admission wait of " +
                                      ms_text(decision.wait) +
                                      " exceeds the wait deadline");
    }
    bump(&OrchestratorStats::admission_waits);
    log_.log(LogLevel::Info,
             "waiting " + ms_text(decision.wait) + " for admission of " +
                 ctx.fp.canonical,
             time_.wall_now());
    if (!suspend(ctx, decision.wait))
      return FetchResult::failure(FetchStatus::Cancelled,
                                  "fetch cancelled by caller");
  }
  return FetchResult::failure(FetchStatus::QuotaExhausted,
                              "rate limited: no admission after " +
                                  std::to_string(cfg_.max_admission_attempts) +
                                  " attempts");
}

// Sleeps on the leader's own token. Returns false once the leader has
// cancelled, after leadership was released.
bool FetchOrchestrator::suspend(LeaderContext &ctx, Duration d) {
  const bool slept = time_.wait_for(d, ctx.cancel);
  note_leader_cancel(ctx);
  return slept && !ctx.withdrawn;
}

void FetchOrchestrator::note_leader_cancel(LeaderContext &ctx) {
  if (ctx.withdrawn || !ctx.cancel.cancelled())
    return;
  ctx.withdrawn = true;
  ctx.handed_off = release_leadership(*ctx.flight);
  log_.log(LogLevel::Info,
           "leader for " + ctx.fp.canonical + " cancelled" +
               (ctx.handed_off ? ", handing off to a waiting caller" : ""),
           time_.wall_now());
}

// Drops the leader's interest. True when other callers remain and one of
// them is to take over the work.
bool FetchOrchestrator::release_leadership(Flight &flight) {
  std::lock_guard<std::mutex> lk(flights_mu_);
  if (flight.interest > 0)
    --flight.interest;
  if (flight.interest == 0) {
    flight.abandoned = true;
    return false;
  }
  flight.handoff = true;
  return true;
}

bool FetchOrchestrator::claim_leadership(Flight &flight) {
  std::lock_guard<std::mutex> lk(flights_mu_);
  if (!flight.handoff || flight.abandoned || flight.completed)
    return false;
  flight.handoff = false;
  return true;
}

void FetchOrchestrator::withdraw(Flight &flight) {
  bool orphaned = false;
  {
    std::lock_guard<std::mutex> lk(flights_mu_);
    if (flight.interest > 0)
      --flight.interest;
    if (flight.interest == 0) {
      flight.abandoned = true;
      // Nobody is left to pick up a pending handoff.
      orphaned = flight.handoff;
      flight.handoff = false;
    }
  }
  if (orphaned)
    complete(flight, FetchResult::failure(FetchStatus::Cancelled,
                                          "all callers cancelled"));
}

void FetchOrchestrator::complete(Flight &flight, const FetchResult &r) {
  {
    std::lock_guard<std::mutex> lk(flights_mu_);
    if (flight.completed)
      return;
    flight.completed = true;
    flight.handoff = false;
    auto it = flights_.find(flight.key);
    if (it != flights_.end() && it->second.get() == &flight)
      flights_.erase(it);
  }
  flight.promise.set_value(r);
}

FetchResult FetchOrchestrator::await_follower(
    const Fingerprint &fp, const QueryParams &params,
    const UpstreamCall &upstream, const std::shared_ptr<Flight> &flight,
    const CancellationToken &cancel) {
  // The shared future is waited on in real time, so the bound is too.
  const auto give_up = Clock::now() + cfg_.follower_max_wait;
  while (flight->result.wait_for(cfg_.follower_poll) !=
         std::future_status::ready) {
    if (cancel.cancelled()) {
      withdraw(*flight);
      bump(&OrchestratorStats::cancellations);
      return finish(fp, FetchResult::failure(
                            FetchStatus::Cancelled,
                            "cancelled while waiting on in-flight fetch"));
    }
    if (claim_leadership(*flight)) {
      log_.log(LogLevel::Info, "taking over in-flight fetch of " + fp.canonical,
               time_.wall_now());
      return lead(fp, params, upstream, cancel, flight);
    }
    if (Clock::now() >= give_up) {
      withdraw(*flight);
      log_.log(LogLevel::Warn,
               "gave up waiting on in-flight fetch of " + fp.canonical,
               time_.wall_now());
      return finish(fp, FetchResult::failure(
                            FetchStatus::TransportFailure,
                            "timed out waiting on in-flight fetch"));
    }
  }
  FetchResult r = flight->result.get();
  r.shared = true;
  return finish(fp, std::move(r));
}

FetchResult FetchOrchestrator::finish(const Fingerprint &fp, FetchResult r) {
  if (!r.ok() && r.status != FetchStatus::Cancelled)
    bump(&OrchestratorStats::failures);
  trace_outcome(fp, r);
  return r;
}

void FetchOrchestrator::trace_outcome(const Fingerprint &fp,
                                      const FetchResult &r) {
  const auto ts_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         time_.wall_now().time_since_epoch())
                         .count();
  std::ostringstream line;
  line << "{\"ts_ms\":" << ts_ms << ",\"family\":\"" << json_escape(fp.family)
       << "\",\"key\":\"" << json_escape(fp.key) << "\",\"status\":\""
       << fetch_status_name(r.status) << "\",\"from_cache\":"
       << (r.from_cache ? "true" : "false")
       << ",\"shared\":" << (r.shared ? "true" : "false")
       << ",\"ttl_class\":\"" << ttl_class_name(r.ttl_class)
       << "\",\"attempts\":" << r.upstream_attempts
       << ",\"payload_bytes\":" << r.payload.size() << "}";
  log_.trace(line.str());
}

void FetchOrchestrator::bump(std::uint64_t OrchestratorStats::*field) {
  std::lock_guard<std::mutex> lk(stats_mu_);
  ++(stats_.*field);
}

OrchestratorStats FetchOrchestrator::stats() const {
  std::lock_guard<std::mutex> lk(stats_mu_);
  return stats_;
}

std::size_t FetchOrchestrator::in_flight() const {
  std::lock_guard<std::mutex> lk(flights_mu_);
  return flights_.size();
}

std::string FetchOrchestrator::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "fetches:" << s.fetches << "\n";
  os << "fetch_cache_hits:" << s.cache_hits << "\n";
  os << "upstream_calls:" << s.upstream_calls << "\n";
  os << "dedup_joins:" << s.dedup_joins << "\n";
  os << "admission_waits:" << s.admission_waits << "\n";
  os << "transport_retries:" << s.transport_retries << "\n";
  os << "failures:" << s.failures << "\n";
  os << "cancellations:" << s.cancellations << "\n";
  os << "in_flight:" << in_flight() << "\n";
  os << limiter_.info();
  os << cache_.info();
  return os.str();
}

} // namespace quota_cache
