#include <voxturn/actions/commit_report.hpp>

#include <cstdio>
#include <ctime>
#include <regex>
#include <stdexcept>

#include <voxturn/actions/command_registry.hpp>

using json = nlohmann::json;

namespace voxturn {

static bool leap_year(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && leap_year(y)) ? 29 : days[m - 1];
}

std::string CalendarDate::isoMidnight() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT00:00:00+00:00", year, month, day);
  return buf;
}

CalendarDate CalendarDate::daysBefore(int days) const {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = 12;
  std::time_t t = ::timegm(&tm) - static_cast<std::time_t>(days) * 24 * 60 * 60;
  std::tm out{};
  ::gmtime_r(&t, &out);
  return CalendarDate{out.tm_year + 1900, out.tm_mon + 1, out.tm_mday};
}

CalendarDate CalendarDate::localToday() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::optional<CalendarDate> parseSpokenDate(const std::string& text) {
  static const std::regex pattern(R"((\d{4})(?:年|-)(\d{1,2})(?:月|-)(\d{1,2}))");
  std::smatch m;
  if (!std::regex_search(text, m, pattern)) return std::nullopt;
  CalendarDate d{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
  if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
  if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
  return d;
}

json commitReportRequest(const CommitReportOptions& opts,
                         const std::string& owner,
                         const std::string& repository,
                         const std::string& since,
                         const std::string& until) {
  return json{
    {"input", {
      {"github", {
        {"target", opts.github_target},
        {"owner", owner},
        {"name", repository},
        {"since", since},
        {"until", until},
      }},
      {"gsheet", {{"sheetId", opts.sheet_id}}},
    }},
  };
}

static std::string cell(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

std::string describeCommitReport(const json& reply) {
  if (!reply.is_object()) throw std::runtime_error("commit count reply is not an object");
  auto err = reply.find("error");
  if (err != reply.end()) {
    return "The commit count report returned an error: " + cell(*err);
  }
  json row;
  try {
    row = reply.at("output").at("github").at("output").at("values").at(0);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("commit count reply has no report row: ") + e.what());
  }
  // [0] author, [2] repository, [5] commit count
  if (!row.is_array() || row.size() < 6) {
    throw std::runtime_error("commit count report row too short: " + row.dump());
  }
  return "According to the commit count report, " + cell(row[0]) + " contributed " + cell(row[5]) +
         " commits to the repository " + cell(row[2]);
}

void registerCommitReportCommand(DeviceActionDispatcher& dispatcher,
                                 HttpClient& http,
                                 TextToSpeech& tts,
                                 Context& ctx,
                                 CommitReportOptions opts) {
  dispatcher.registerCommand("com.voxturn.commands.ReportCommitCount", [&http, &tts, &ctx, opts](const json& p) {
    const std::string repository = paramToString(p, "repository");
    const std::string start = paramToString(p, "start");
    const std::string end = paramToString(p, "end");
    ctx.log().info("Action", "Querying " + repository + " from " + start + " to " + end);

    auto owner = opts.owners.find(repository);
    if (owner == opts.owners.end()) {
      ctx.log().warn("Action", "No owner known for repository " + repository);
      tts.say("I don't know the repository " + repository);
      return;
    }

    std::optional<CalendarDate> since = start.empty() ? opts.today() : parseSpokenDate(start);
    std::optional<CalendarDate> until = end.empty() ? opts.today().daysBefore(30) : parseSpokenDate(end);
    if (!since || !until) {
      ctx.log().warn("Action", "Unreadable report dates: '" + start + "', '" + end + "'");
      tts.say("I could not understand the dates for the commit count report");
      return;
    }
    ctx.log().debug("Action", "owner " + owner->second + " since " + since->isoMidnight() +
                              " until " + until->isoMidnight());

    json request = commitReportRequest(opts, owner->second, repository, since->isoMidnight(), until->isoMidnight());
    json reply;
    try {
      reply = http.postJson(opts.url, request);
    } catch (const TransportError& e) {
      ctx.log().error("Action", std::string("Commit count report failed: ") + e.what());
      tts.say("The commit count report failed");
      throw;
    }

    if (reply.is_object() && reply.contains("error")) {
      ctx.log().warn("Action", "Commit count report returned error " + reply["error"].dump());
    } else {
      ctx.log().info("Action", "Commit count report returned " + reply.dump());
    }
    tts.say(describeCommitReport(reply));
  });
}

} // namespace voxturn
