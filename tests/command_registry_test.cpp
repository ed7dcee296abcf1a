#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include <voxturn/actions/command_registry.hpp>
#include <voxturn/core/errors.hpp>
#include <voxturn/core/shell.hpp>

using namespace voxturn;
using json = nlohmann::json;

namespace {

class RecordingSpeech : public TextToSpeech {
public:
  void say(const std::string& text) override { spoken.push_back(text); }
  std::vector<std::string> spoken;
};

TEST(ExecCommands, ParsesExecAndSwitchEntries) {
  auto cmds = parseExecCommands(R"(
commands:
  - name: action.devices.commands.OnOff
    switch: on
    cases:
      "true": ./bin/light_on
      "false": ./bin/light_off
  - name: com.example.commands.Play
    exec: aplay {file}
    say: Playing {file}
)");
  ASSERT_EQ(cmds.size(), 2u);
  EXPECT_EQ(cmds[0].name, "action.devices.commands.OnOff");
  EXPECT_EQ(cmds[0].switch_param, "on");
  EXPECT_EQ(cmds[0].cases.at("true"), "./bin/light_on");
  EXPECT_EQ(cmds[1].exec, "aplay {file}");
  EXPECT_EQ(cmds[1].say, "Playing {file}");
}

TEST(ExecCommands, EmptyDocumentHasNoCommands) {
  EXPECT_TRUE(parseExecCommands("").empty());
  EXPECT_TRUE(parseExecCommands("other: 1").empty());
}

TEST(ExecCommands, InvalidEntriesRejected) {
  EXPECT_THROW(parseExecCommands("commands: {a: 1}"), ConfigurationError);
  EXPECT_THROW(parseExecCommands("commands:\n  - exec: ls"), ConfigurationError);
  EXPECT_THROW(parseExecCommands("commands:\n  - name: x"), ConfigurationError);
  EXPECT_THROW(parseExecCommands("commands:\n  - name: x\n    switch: on"), ConfigurationError);
  EXPECT_THROW(parseExecCommands("commands:\n  - name: x\n    switch: on\n    cases: [a, b]"),
               ConfigurationError);
  EXPECT_THROW(parseExecCommands("commands: [unclosed"), ConfigurationError);
}

TEST(ExecCommands, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "voxturn_actions.yaml";
  {
    std::ofstream out(path);
    out << "commands:\n  - name: com.example.Beep\n    exec: beep\n";
  }
  auto cmds = loadExecCommands(path);
  ASSERT_EQ(cmds.size(), 1u);
  EXPECT_EQ(cmds[0].exec, "beep");
  std::remove(path.c_str());

  EXPECT_THROW(loadExecCommands(::testing::TempDir() + "voxturn_missing.yaml"), ConfigurationError);
}

TEST(ExecCommands, ParamToString) {
  json p = {{"s", "text"}, {"b", true}, {"n", 42}, {"o", {{"k", 1}}}};
  EXPECT_EQ(paramToString(p, "s"), "text");
  EXPECT_EQ(paramToString(p, "b"), "true");
  EXPECT_EQ(paramToString(p, "n"), "42");
  EXPECT_EQ(paramToString(p, "o"), R"({"k":1})");
  EXPECT_EQ(paramToString(p, "missing"), "");
  EXPECT_EQ(paramToString(json::array(), "s"), "");
}

TEST(ExecCommands, TemplateQuotesForShellOnly) {
  json p = {{"file", "it's.wav"}};
  EXPECT_EQ(renderTemplate("aplay {file}", p, true), "aplay 'it'\\''s.wav'");
  EXPECT_EQ(renderTemplate("Playing {file}", p, false), "Playing it's.wav");
  EXPECT_EQ(renderTemplate("no {closing", p, false), "no {closing");
}

TEST(ExecCommands, SwitchSelectsCase) {
  ExecCommand c;
  c.name = "OnOff";
  c.switch_param = "on";
  c.cases = {{"true", "light on"}, {"false", "light off"}};
  EXPECT_EQ(c.commandLine(json{{"on", true}}), "light on");
  EXPECT_EQ(c.commandLine(json{{"on", false}}), "light off");
  EXPECT_THROW(c.commandLine(json{{"on", "maybe"}}), std::runtime_error);
  EXPECT_THROW(c.commandLine(json::object()), std::runtime_error);
}

class ExecRegistrationTest : public ::testing::Test {
protected:
  ExecRegistrationTest() : ctx(out, err), executor(1), dispatcher(ctx, "dev-1", executor) {}

  std::ostringstream out, err;
  Context ctx;
  ActionExecutor executor;
  DeviceActionDispatcher dispatcher;
  RecordingSpeech speech;
};

TEST_F(ExecRegistrationTest, SuccessfulProgramSpeaks) {
  auto cmds = parseExecCommands(R"(
commands:
  - name: com.example.Ok
    exec: "true {x}"
    say: Done with {x}
)");
  registerExecCommands(dispatcher, cmds, speech, ctx);
  ASSERT_TRUE(dispatcher.hasCommand("com.example.Ok"));

  auto pending = dispatcher.handle(DeviceCommand{"com.example.Ok", json{{"x", "lamp"}}});
  ASSERT_EQ(pending.size(), 1u);
  pending[0].wait();
  EXPECT_NO_THROW(pending[0].get());
  EXPECT_EQ(speech.spoken, (std::vector<std::string>{"Done with lamp"}));
}

TEST_F(ExecRegistrationTest, NonZeroExitFailsAction) {
  ExecCommand c;
  c.name = "com.example.Bad";
  c.exec = "false";
  c.say = "never";
  registerExecCommands(dispatcher, {c}, speech, ctx);

  auto pending = dispatcher.handle(DeviceCommand{"com.example.Bad"});
  ASSERT_EQ(pending.size(), 1u);
  pending[0].wait();
  EXPECT_THROW(pending[0].get(), std::runtime_error);
  EXPECT_TRUE(speech.spoken.empty());
}

TEST_F(ExecRegistrationTest, OverridesBuiltinWithNotice) {
  dispatcher.registerCommand("com.example.Ok", [](const json&) {});
  ExecCommand c;
  c.name = "com.example.Ok";
  c.exec = "true";
  registerExecCommands(dispatcher, {c}, speech, ctx);
  EXPECT_NE(out.str().find("overrides"), std::string::npos);
}

TEST(Shell, QuotesAndReportsExitStatus) {
  EXPECT_EQ(shellQuote("plain"), "'plain'");
  EXPECT_EQ(shellQuote("a'b"), "'a'\\''b'");
  EXPECT_EQ(runShell("true"), 0);
  EXPECT_EQ(runShell("exit 3"), 3);
}

TEST(TextToSpeech, RendersCommandTemplate) {
  std::ostringstream out, err;
  Context ctx(out, err);
  EXPECT_EQ(CommandTextToSpeech(ctx, "espeak-ng {text}").render("hi there"), "espeak-ng 'hi there'");
  EXPECT_EQ(CommandTextToSpeech(ctx, "say").render("x"), "say 'x'");
  EXPECT_EQ(CommandTextToSpeech(ctx, "a {text} b {text}").render("x"), "a 'x' b 'x'");
}

TEST(TextToSpeech, FailingCommandThrows) {
  std::ostringstream out, err;
  Context ctx(out, err);
  CommandTextToSpeech ok(ctx, "true");
  EXPECT_NO_THROW(ok.say("fine"));
  CommandTextToSpeech bad(ctx, "false");
  EXPECT_THROW(bad.say("oops"), std::runtime_error);
}

TEST(TextToSpeech, EmptyTemplateOnlyLogs) {
  std::ostringstream out, err;
  Context ctx(out, err);
  auto tts = makeTextToSpeech(ctx, "");
  tts->say("hello");
  EXPECT_NE(out.str().find("hello"), std::string::npos);
}

} // namespace
