#include <gtest/gtest.h>

#include <voxturn/assistant/request_encoder.hpp>

#include "fakes.hpp"

using namespace voxturn;
using namespace voxturn::fakes;

namespace {

TurnConfig makeConfig() {
  TurnConfig c;
  c.language_code = "ja-JP";
  c.device_model_id = "model-1";
  c.device_id = "device-1";
  return c;
}

TEST(RequestEncoder, ConfigFirstThenAudioUntilRecordingStops) {
  FakeAudioChannel audio;
  audio.state().block_when_empty = false;
  audio.state().chunks = {bytes("c1"), bytes("c2")};
  audio.startRecording();

  ConversationState state;
  RequestEncoder enc(makeConfig(), state, audio);

  auto first = enc.next();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->kind, OutboundMessage::Kind::Config);
  EXPECT_EQ(first->config.language_code, "ja-JP");
  EXPECT_EQ(first->config.device_id, "device-1");
  EXPECT_EQ(first->config.device_model_id, "model-1");

  auto a1 = enc.next();
  ASSERT_TRUE(a1);
  EXPECT_EQ(a1->kind, OutboundMessage::Kind::AudioIn);
  EXPECT_EQ(a1->audio_in, bytes("c1"));

  audio.stopRecording();
  EXPECT_FALSE(enc.next());
  // chunks remain but the encoder is finished for good
  audio.startRecording();
  EXPECT_FALSE(enc.next());
}

TEST(RequestEncoder, EndsWhenInputRunsDry) {
  FakeAudioChannel audio;
  audio.state().block_when_empty = false;
  audio.state().chunks = {bytes("only")};
  audio.startRecording();

  ConversationState state;
  RequestEncoder enc(makeConfig(), state, audio);
  ASSERT_TRUE(enc.next());
  ASSERT_TRUE(enc.next());
  EXPECT_FALSE(enc.next());
  EXPECT_FALSE(enc.next());
}

TEST(RequestEncoder, ClearsNewConversationFlagOnConstruction) {
  FakeAudioChannel audio;
  ConversationState state;
  ASSERT_TRUE(state.is_new_conversation);

  RequestEncoder enc(makeConfig(), state, audio);
  EXPECT_FALSE(state.is_new_conversation);
  EXPECT_TRUE(enc.assistConfig().is_new_conversation);

  RequestEncoder second(makeConfig(), state, audio);
  EXPECT_FALSE(second.assistConfig().is_new_conversation);
}

TEST(RequestEncoder, ForwardsContinuationTokenVerbatim) {
  FakeAudioChannel audio;
  ConversationState state;
  state.continuation_token = std::string("\x01\x00\xffopaque", 9);

  RequestEncoder enc(makeConfig(), state, audio);
  auto cfg = enc.next();
  ASSERT_TRUE(cfg);
  ASSERT_TRUE(cfg->config.conversation_state);
  EXPECT_EQ(*cfg->config.conversation_state, *state.continuation_token);
}

TEST(RequestEncoder, AbsentTokenStaysAbsent) {
  FakeAudioChannel audio;
  ConversationState state;
  RequestEncoder enc(makeConfig(), state, audio);
  EXPECT_FALSE(enc.next()->config.conversation_state);
}

TEST(RequestEncoder, ReportsCurrentChannelVolumeAndRate) {
  FakeAudioChannel audio;
  audio.state().sample_rate = 24000;
  audio.setVolumePercentage(80);
  ConversationState state;

  RequestEncoder enc(makeConfig(), state, audio);
  const AssistConfig& c = enc.assistConfig();
  EXPECT_EQ(c.volume_percentage, 80);
  EXPECT_EQ(c.sample_rate_in, 24000);
  EXPECT_EQ(c.sample_rate_out, 24000);
}

TEST(RequestEncoder, ScreenModeOnlyWithDisplay) {
  FakeAudioChannel audio;
  ConversationState state;
  TurnConfig cfg = makeConfig();
  EXPECT_FALSE(RequestEncoder(cfg, state, audio).assistConfig().screen_mode_playing);
  cfg.display_enabled = true;
  EXPECT_TRUE(RequestEncoder(cfg, state, audio).assistConfig().screen_mode_playing);
}

TEST(RequestEncoder, NotRecordingYieldsConfigOnly) {
  FakeAudioChannel audio;
  ConversationState state;
  RequestEncoder enc(makeConfig(), state, audio);
  ASSERT_TRUE(enc.next());
  EXPECT_FALSE(enc.next());
}

} // namespace
