#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/transport/http_client.hpp>
#include <voxturn/tts/text_to_speech.hpp>

namespace voxturn {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    // "YYYY-MM-DDT00:00:00+00:00"
    std::string isoMidnight() const;
    CalendarDate daysBefore(int days) const;

    static CalendarDate localToday();
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

// Finds "2018年6月21日" or "2018-06-21" anywhere in the text. Empty when
// there is none or it is not a real calendar day.
std::optional<CalendarDate> parseSpokenDate(const std::string& text);

struct CommitReportOptions {
    std::string url;                        // state machine endpoint
    std::string sheet_id;
    std::string github_target = "github.com";
    std::map<std::string, std::string> owners = {
        {"faasshell", "naohirotamura"},
        {"buildah", "containers"},
        {"kubernetes", "kubernetes"},
    };
    std::function<CalendarDate()> today = &CalendarDate::localToday;
};

nlohmann::json commitReportRequest(const CommitReportOptions& opts,
                                   const std::string& owner,
                                   const std::string& repository,
                                   const std::string& since,
                                   const std::string& until);

// Sentence to speak for a state machine reply. Throws std::runtime_error
// when the reply carries neither "error" nor a report row.
std::string describeCommitReport(const nlohmann::json& reply);

/**
 * com.voxturn.commands.ReportCommitCount {repository, start, end}
 *
 * Asks the commit count state machine how much was contributed to a known
 * repository and speaks the answer. An empty start means today, an empty
 * end means 30 days before today. `http` and `tts` must outlive the
 * dispatcher.
 */
void registerCommitReportCommand(DeviceActionDispatcher& dispatcher,
                                 HttpClient& http,
                                 TextToSpeech& tts,
                                 Context& ctx,
                                 CommitReportOptions opts);

} // namespace voxturn
