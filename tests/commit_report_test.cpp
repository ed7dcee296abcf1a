#include <gtest/gtest.h>

#include <sstream>

#include <voxturn/actions/commit_report.hpp>

using namespace voxturn;
using json = nlohmann::json;

namespace {

class StubHttp : public HttpClient {
public:
  json postJson(const std::string& url, const json& body) override {
    urls.push_back(url);
    bodies.push_back(body);
    if (fail) throw TransportError(StatusCode::Unavailable, "connection refused");
    return reply;
  }

  json reply = json::object();
  bool fail = false;
  std::vector<std::string> urls;
  std::vector<json> bodies;
};

class RecordingSpeech : public TextToSpeech {
public:
  void say(const std::string& text) override { spoken.push_back(text); }
  std::vector<std::string> spoken;
};

json reportRow(const json& row) {
  return json{{"output", {{"github", {{"output", {{"values", json::array({row})}}}}}}}};
}

TEST(SpokenDate, JapaneseAndIsoForms) {
  auto d = parseSpokenDate("2018年6月21日");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->isoMidnight(), "2018-06-21T00:00:00+00:00");

  d = parseSpokenDate("from 2018-07-20 please");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->isoMidnight(), "2018-07-20T00:00:00+00:00");

  EXPECT_FALSE(parseSpokenDate(""));
  EXPECT_FALSE(parseSpokenDate("yesterday"));
  EXPECT_FALSE(parseSpokenDate("2018年13月1日"));
  EXPECT_FALSE(parseSpokenDate("2019年2月29日"));
  EXPECT_TRUE(parseSpokenDate("2020年2月29日"));
}

TEST(CalendarDate, DaysBeforeCrossesMonthAndYear) {
  EXPECT_EQ(CalendarDate({2018, 7, 20}).daysBefore(30), CalendarDate({2018, 6, 20}));
  EXPECT_EQ(CalendarDate({2020, 1, 10}).daysBefore(30), CalendarDate({2019, 12, 11}));
  EXPECT_EQ(CalendarDate({2020, 3, 1}).daysBefore(1), CalendarDate({2020, 2, 29}));
}

TEST(CommitReport, RequestShape) {
  CommitReportOptions opts;
  opts.sheet_id = "sheet-1";
  opts.github_target = "git.example.com";
  json req = commitReportRequest(opts, "containers", "buildah", "a", "b");
  EXPECT_EQ(req["input"]["github"]["target"], "git.example.com");
  EXPECT_EQ(req["input"]["github"]["owner"], "containers");
  EXPECT_EQ(req["input"]["github"]["name"], "buildah");
  EXPECT_EQ(req["input"]["github"]["since"], "a");
  EXPECT_EQ(req["input"]["github"]["until"], "b");
  EXPECT_EQ(req["input"]["gsheet"]["sheetId"], "sheet-1");
}

TEST(CommitReport, DescribeReply) {
  EXPECT_EQ(describeCommitReport(reportRow({"alice", "x", "faasshell", "y", "z", 42})),
            "According to the commit count report, alice contributed 42 commits to the repository faasshell");
  EXPECT_EQ(describeCommitReport(json{{"error", "sheet not found"}}),
            "The commit count report returned an error: sheet not found");
  EXPECT_THROW(describeCommitReport(json{{"output", json::object()}}), std::runtime_error);
  EXPECT_THROW(describeCommitReport(reportRow({"alice", "x"})), std::runtime_error);
  EXPECT_THROW(describeCommitReport(json::array()), std::runtime_error);
}

class ReportCommitCountTest : public ::testing::Test {
protected:
  ReportCommitCountTest() : ctx(out, err), executor(1), dispatcher(ctx, "dev-1", executor) {
    CommitReportOptions opts;
    opts.url = "https://report.test/statemachine/commit_count_report.json?blocking=true";
    opts.sheet_id = "sheet-1";
    opts.today = [] { return CalendarDate{2018, 7, 20}; };
    registerCommitReportCommand(dispatcher, http, speech, ctx, opts);
  }

  void run(json params) {
    auto pending = dispatcher.handle(DeviceCommand{"com.voxturn.commands.ReportCommitCount", std::move(params)});
    ASSERT_EQ(pending.size(), 1u);
    pending[0].wait();
    pending[0].get();
  }

  std::ostringstream out, err;
  Context ctx;
  StubHttp http;
  RecordingSpeech speech;
  ActionExecutor executor;
  DeviceActionDispatcher dispatcher;
};

TEST_F(ReportCommitCountTest, SpeaksReportRow) {
  http.reply = reportRow({"naohirotamura", "-", "faasshell", "-", "-", 17});
  run({{"repository", "faasshell"}, {"start", "2018年6月21日"}, {"end", "2018年7月20日"}});

  ASSERT_EQ(http.bodies.size(), 1u);
  EXPECT_EQ(http.urls[0], "https://report.test/statemachine/commit_count_report.json?blocking=true");
  const json& gh = http.bodies[0]["input"]["github"];
  EXPECT_EQ(gh["owner"], "naohirotamura");
  EXPECT_EQ(gh["name"], "faasshell");
  EXPECT_EQ(gh["since"], "2018-06-21T00:00:00+00:00");
  EXPECT_EQ(gh["until"], "2018-07-20T00:00:00+00:00");
  ASSERT_EQ(speech.spoken.size(), 1u);
  EXPECT_EQ(speech.spoken[0],
            "According to the commit count report, naohirotamura contributed 17 commits to the repository faasshell");
}

TEST_F(ReportCommitCountTest, EmptyDatesDefaultToTodayAndThirtyDaysBack) {
  http.reply = reportRow({"a", "-", "kubernetes", "-", "-", "3"});
  run({{"repository", "kubernetes"}, {"start", ""}, {"end", ""}});

  ASSERT_EQ(http.bodies.size(), 1u);
  const json& gh = http.bodies[0]["input"]["github"];
  EXPECT_EQ(gh["owner"], "kubernetes");
  EXPECT_EQ(gh["since"], "2018-07-20T00:00:00+00:00");
  EXPECT_EQ(gh["until"], "2018-06-20T00:00:00+00:00");
}

TEST_F(ReportCommitCountTest, SpeaksServiceError) {
  http.reply = json{{"error", "rate limited"}};
  run({{"repository", "buildah"}});

  ASSERT_EQ(http.bodies.size(), 1u);
  EXPECT_EQ(http.bodies[0]["input"]["github"]["owner"], "containers");
  ASSERT_EQ(speech.spoken.size(), 1u);
  EXPECT_EQ(speech.spoken[0], "The commit count report returned an error: rate limited");
}

TEST_F(ReportCommitCountTest, UnknownRepositoryMakesNoRequest) {
  run({{"repository", "linux"}});
  EXPECT_TRUE(http.bodies.empty());
  ASSERT_EQ(speech.spoken.size(), 1u);
  EXPECT_EQ(speech.spoken[0], "I don't know the repository linux");
}

TEST_F(ReportCommitCountTest, UnreadableDateMakesNoRequest) {
  run({{"repository", "faasshell"}, {"start", "last week"}});
  EXPECT_TRUE(http.bodies.empty());
  ASSERT_EQ(speech.spoken.size(), 1u);
}

TEST_F(ReportCommitCountTest, TransportFailureIsSpokenAndFailsTheAction) {
  http.fail = true;
  EXPECT_THROW(run({{"repository", "faasshell"}}), TransportError);
  ASSERT_EQ(speech.spoken.size(), 1u);
  EXPECT_EQ(speech.spoken[0], "The commit count report failed");
}

TEST(HttpReplyStatus, MapsCommonCodes) {
  EXPECT_EQ(statusFromHttpReply(200), StatusCode::Ok);
  EXPECT_EQ(statusFromHttpReply(201), StatusCode::Ok);
  EXPECT_EQ(statusFromHttpReply(401), StatusCode::Unauthenticated);
  EXPECT_EQ(statusFromHttpReply(503), StatusCode::Unavailable);
  EXPECT_EQ(statusFromHttpReply(500), StatusCode::Internal);
  EXPECT_EQ(statusFromHttpReply(418), StatusCode::Unknown);
}

TEST(CurlHttpClient, RefusedConnectionIsUnavailable) {
  CurlHttpClient::Options opts;
  opts.timeout = std::chrono::seconds(5);
  CurlHttpClient client(opts);
  try {
    client.postJson("http://127.0.0.1:1/report", json::object());
    FAIL() << "POST to a closed port must throw";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.code(), StatusCode::Unavailable);
  }
}

} // namespace
