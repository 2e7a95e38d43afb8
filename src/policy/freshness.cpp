#include "quota_cache/freshness.hpp"
#include "quota_cache/fingerprint.hpp"

#include <regex>
#include <unordered_set>

namespace quota_cache {
namespace {
const std::unordered_set<std::string> &finished_short() {
  static const std::unordered_set<std::string> s{
      "FT", "AET", "PEN", "PST", "CANC", "ABD", "AWD", "WO"};
  return s;
}
const std::unordered_set<std::string> &finished_long() {
  static const std::unordered_set<std::string> s{
      "Match Finished",
      "Match Finished After Extra Time",
      "Match Finished After Penalty",
      "Match Postponed",
      "Match Cancelled",
      "Match Abandoned",
      "Technical Loss",
      "WalkOver"};
  return s;
}
const std::unordered_set<std::string> &in_play_short() {
  static const std::unordered_set<std::string> s{
      "1H", "HT", "2H", "ET", "BT", "P", "SUSP", "INT", "LIVE"};
  return s;
}
const std::unordered_set<std::string> &in_play_long() {
  static const std::unordered_set<std::string> s{
      "First Half",      "Halftime",          "Second Half",
      "Extra Time",      "Break Time",        "Penalty In Progress",
      "Match Suspended", "Match Interrupted", "In Play",
      "In Progress"};
  return s;
}

std::optional<std::string> find_string(const std::string &json,
                                       const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return m[1].str();
}

bool is_fixture_family(const std::string &f) {
  return f == family::kFixtures || f == family::kHeadToHead;
}

bool is_reference_family(const std::string &f) {
  return f == family::kTeams || f == family::kVenues ||
         f == family::kLeagues || f == family::kSeasons ||
         f == family::kCountries;
}
} // namespace

const char *ttl_class_name(TtlClass c) {
  switch (c) {
  case TtlClass::Permanent:
    return "permanent";
  case TtlClass::Long:
    return "long";
  case TtlClass::Medium:
    return "medium";
  case TtlClass::Short:
    return "short";
  case TtlClass::None:
    return "none";
  }
  return "unknown";
}

std::optional<Duration> TtlPolicy::ttl_for(TtlClass c) const {
  switch (c) {
  case TtlClass::Permanent:
    return std::nullopt;
  case TtlClass::Long:
    return std::chrono::duration_cast<Duration>(long_ttl);
  case TtlClass::Medium:
    return std::chrono::duration_cast<Duration>(medium_ttl);
  case TtlClass::Short:
    return std::chrono::duration_cast<Duration>(short_ttl);
  case TtlClass::None:
    break;
  }
  return Duration::zero();
}

FixtureState fixture_state(const std::string &short_status,
                           const std::string &long_status) {
  if (in_play_short().count(short_status) || in_play_long().count(long_status))
    return FixtureState::InPlay;
  if (finished_short().count(short_status) ||
      finished_long().count(long_status))
    return FixtureState::Finished;
  return FixtureState::Scheduled;
}

std::vector<FixtureStatus> extract_fixture_statuses(const std::string &payload) {
  static const std::regex status_re("\"status\"\\s*:\\s*\\{([^}]*)\\}");
  std::vector<FixtureStatus> out;
  for (auto it = std::sregex_iterator(payload.begin(), payload.end(), status_re);
       it != std::sregex_iterator(); ++it) {
    const std::string body = (*it)[1].str();
    FixtureStatus st;
    if (auto v = find_string(body, "short"))
      st.short_status = *v;
    if (auto v = find_string(body, "long"))
      st.long_status = *v;
    if (st.short_status.empty() && st.long_status.empty())
      continue;
    out.push_back(std::move(st));
  }
  return out;
}

TtlClass classify(const std::string &f, const QueryParams &params,
                  const std::string &payload) {
  if (is_reference_family(f))
    return TtlClass::Long;
  if (f == family::kStandings)
    return TtlClass::Short;
  if (!is_fixture_family(f))
    return TtlClass::Medium;

  auto live = params.find("live");
  if (live != params.end() && !live->second.empty())
    return TtlClass::None;

  const auto statuses = extract_fixture_statuses(payload);
  if (statuses.empty())
    return TtlClass::None;
  bool all_finished = true;
  for (const auto &st : statuses) {
    const auto state = fixture_state(st.short_status, st.long_status);
    if (state == FixtureState::InPlay)
      return TtlClass::None;
    if (state != FixtureState::Finished)
      all_finished = false;
  }
  return all_finished ? TtlClass::Permanent : TtlClass::Medium;
}

} // namespace quota_cache
