#include "quota_cache/tools.hpp"

#include "quota_cache/fingerprint.hpp"

#include <regex>

namespace quota_cache {
namespace {
void put(QueryParams &p, const char *name, const std::string &v) {
  if (!v.empty())
    p[name] = v;
}
void put(QueryParams &p, const char *name,
         const std::optional<std::uint64_t> &v) {
  if (v.has_value())
    p[name] = std::to_string(*v);
}

FetchResult invalid(std::string why) {
  return FetchResult::failure(FetchStatus::InvalidQuery, std::move(why));
}

bool valid_id_list(const std::string &ids) {
  static const std::regex re("^[0-9]+(-[0-9]+)*$");
  return std::regex_match(ids, re);
}
} // namespace

bool valid_date(const std::string &date) {
  static const std::regex re("^([0-9]{4})-([0-9]{2})-([0-9]{2})$");
  std::smatch m;
  if (!std::regex_match(date, m, re))
    return false;
  const int year = std::stoi(m[1].str());
  const int month = std::stoi(m[2].str());
  const int day = std::stoi(m[3].str());
  if (month < 1 || month > 12 || day < 1)
    return false;
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  const int max_day = (month == 2 && leap) ? 29 : days[month - 1];
  return day <= max_day;
}

SportsTools::SportsTools(FetchOrchestrator &orchestrator, UpstreamCall upstream)
    : orchestrator_(orchestrator), upstream_(std::move(upstream)) {}

FetchResult SportsTools::run(const std::string &family,
                             const QueryParams &params,
                             const CancellationToken &cancel) {
  return orchestrator_.fetch(family, params, upstream_, cancel);
}

FetchResult SportsTools::search_teams(const TeamQuery &q,
                                      const CancellationToken &cancel) {
  if (!q.search.empty() && q.search.size() < 3)
    return invalid("search must be at least 3 characters long");
  QueryParams p;
  put(p, "id", q.id);
  put(p, "name", q.name);
  put(p, "league", q.league);
  put(p, "season", q.season);
  put(p, "country", q.country);
  put(p, "code", q.code);
  put(p, "venue", q.venue);
  put(p, "search", q.search);
  if (p.empty())
    return invalid("at least one team filter is required");
  return run(family::kTeams, p, cancel);
}

FetchResult SportsTools::get_fixtures(const FixtureQuery &q,
                                      const CancellationToken &cancel) {
  if (q.last.has_value() && *q.last > 99)
    return invalid("last must be 2 digits or less");
  if (q.next.has_value() && *q.next > 99)
    return invalid("next must be 2 digits or less");
  if (!q.date.empty() && !valid_date(q.date))
    return invalid("date must be in YYYY-MM-DD format");
  if (!q.from.empty() && !valid_date(q.from))
    return invalid("from date must be in YYYY-MM-DD format");
  if (!q.to.empty() && !valid_date(q.to))
    return invalid("to date must be in YYYY-MM-DD format");
  if (!q.ids.empty() && !valid_id_list(q.ids))
    return invalid("ids must be dash-separated fixture ids");
  if (!q.live.empty() && q.live != "all" && !valid_id_list(q.live))
    return invalid("live must be 'all' or dash-separated league ids");

  QueryParams p;
  put(p, "id", q.id);
  put(p, "ids", q.ids);
  put(p, "live", q.live);
  put(p, "date", q.date);
  put(p, "league", q.league);
  put(p, "season", q.season);
  put(p, "team", q.team);
  put(p, "last", q.last);
  put(p, "next", q.next);
  put(p, "from", q.from);
  put(p, "to", q.to);
  put(p, "round", q.round);
  put(p, "status", q.status);
  put(p, "venue", q.venue);
  put(p, "timezone", q.timezone);
  if (p.empty())
    return invalid("at least one fixture filter is required");
  return run(family::kFixtures, p, cancel);
}

FetchResult SportsTools::get_team_statistics(std::uint64_t league,
                                             std::uint64_t team,
                                             std::uint64_t season,
                                             const std::string &date,
                                             const CancellationToken &cancel) {
  if (league == 0 || team == 0 || season == 0)
    return invalid("league, team and season are required");
  if (!date.empty() && !valid_date(date))
    return invalid("date must be in YYYY-MM-DD format");
  QueryParams p{{"league", std::to_string(league)},
                {"team", std::to_string(team)},
                {"season", std::to_string(season)}};
  put(p, "date", date);
  return run(family::kTeamStatistics, p, cancel);
}

FetchResult SportsTools::get_standings(std::uint64_t league,
                                       std::uint64_t season,
                                       std::optional<std::uint64_t> team,
                                       const CancellationToken &cancel) {
  if (league == 0 || season == 0)
    return invalid("league and season are required");
  QueryParams p{{"league", std::to_string(league)},
                {"season", std::to_string(season)}};
  put(p, "team", team);
  return run(family::kStandings, p, cancel);
}

FetchResult SportsTools::get_head2head(const std::string &h2h,
                                       std::optional<std::uint64_t> last,
                                       std::optional<std::uint64_t> season,
                                       const CancellationToken &cancel) {
  static const std::regex re("^[0-9]+-[0-9]+$");
  if (!std::regex_match(h2h, re))
    return invalid("h2h must be two team ids joined by '-'");
  if (last.has_value() && *last > 99)
    return invalid("last must be 2 digits or less");
  QueryParams p{{"h2h", h2h}};
  put(p, "last", last);
  put(p, "season", season);
  return run(family::kHeadToHead, p, cancel);
}

} // namespace quota_cache
