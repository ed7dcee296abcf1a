#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include <voxturn/transport/websocket_transport.hpp>
#include <voxturn/transport/wire_codec.hpp>

using namespace voxturn;
using json = nlohmann::json;

namespace {

AssistConfig sampleConfig() {
  AssistConfig c;
  c.language_code = "en-US";
  c.device_id = "dev-1";
  c.device_model_id = "model-1";
  c.sample_rate_in = 16000;
  c.sample_rate_out = 24000;
  c.volume_percentage = 40;
  c.is_new_conversation = true;
  return c;
}

TEST(WireCodec, EncodesConfig) {
  json j = wire::encodeOutbound(OutboundMessage::makeConfig(sampleConfig()));
  const json& cfg = j.at("config");
  EXPECT_EQ(cfg.at("audio_in_config").at("encoding"), "LINEAR16");
  EXPECT_EQ(cfg.at("audio_in_config").at("sample_rate_hertz"), 16000);
  EXPECT_EQ(cfg.at("audio_out_config").at("sample_rate_hertz"), 24000);
  EXPECT_EQ(cfg.at("audio_out_config").at("volume_percentage"), 40);
  EXPECT_EQ(cfg.at("dialog_state_in").at("language_code"), "en-US");
  EXPECT_TRUE(cfg.at("dialog_state_in").at("is_new_conversation").get<bool>());
  EXPECT_FALSE(cfg.at("dialog_state_in").contains("conversation_state"));
  EXPECT_EQ(cfg.at("device_config").at("device_id"), "dev-1");
  EXPECT_EQ(cfg.at("device_config").at("device_model_id"), "model-1");
  EXPECT_FALSE(cfg.contains("screen_out_config"));
}

TEST(WireCodec, EncodesConversationStateAndScreenMode) {
  AssistConfig c = sampleConfig();
  c.conversation_state = std::string("AB");
  c.screen_mode_playing = true;
  json cfg = wire::encodeOutbound(OutboundMessage::makeConfig(c)).at("config");
  EXPECT_EQ(cfg.at("dialog_state_in").at("conversation_state"), "QUI=");
  EXPECT_EQ(cfg.at("screen_out_config").at("screen_mode"), "PLAYING");
}

TEST(WireCodec, EncodesAudioBase64) {
  json j = wire::encodeOutbound(OutboundMessage::makeAudio(AudioBytes{'A', 'B'}));
  EXPECT_EQ(j.at("audio_in"), "QUI=");
  EXPECT_FALSE(j.contains("config"));
  EXPECT_TRUE(wire::encodeAudioInDone().at("audio_in_done").get<bool>());
}

TEST(WireCodec, DecodesEveryField) {
  InboundMessage m = wire::parseInbound(R"({
    "event_type": "END_OF_UTTERANCE",
    "speech_results": [{"transcript": "turn on"}, {"transcript": ""}, {"transcript": "the light"}],
    "audio_out": {"audio_data": "QUI="},
    "dialog_state_out": {
      "conversation_state": "QUI=",
      "volume_percentage": 70,
      "microphone_mode": "DIALOG_FOLLOW_ON",
      "supplemental_display_text": "OK"
    },
    "device_action": {"device_request_json": "{\"inputs\":[]}"},
    "screen_out": {"format": "HTML", "data": "PGgxPg=="}
  })");
  EXPECT_EQ(m.event_type, EventType::EndOfUtterance);
  EXPECT_EQ(m.speech_results, (std::vector<std::string>{"turn on", "the light"}));
  EXPECT_EQ(m.audio_out, (AudioBytes{'A', 'B'}));
  ASSERT_TRUE(m.dialog_state_out.conversation_state);
  EXPECT_EQ(*m.dialog_state_out.conversation_state, "AB");
  EXPECT_EQ(m.dialog_state_out.volume_percentage, 70);
  EXPECT_EQ(m.dialog_state_out.microphone_mode, MicrophoneMode::DialogFollowOn);
  EXPECT_EQ(m.dialog_state_out.supplemental_display_text, "OK");
  ASSERT_TRUE(m.device_request_json);
  EXPECT_EQ(*m.device_request_json, R"({"inputs":[]})");
  ASSERT_TRUE(m.screen_out_data);
  EXPECT_EQ(*m.screen_out_data, "<h1>");
}

TEST(WireCodec, MissingFieldsStayUnset) {
  InboundMessage m = wire::parseInbound(R"({"dialog_state_out": {"microphone_mode": "CLOSE_MICROPHONE"}})");
  EXPECT_EQ(m.event_type, EventType::None);
  EXPECT_TRUE(m.audio_out.empty());
  EXPECT_FALSE(m.dialog_state_out.conversation_state);
  EXPECT_EQ(m.dialog_state_out.volume_percentage, 0);
  EXPECT_EQ(m.dialog_state_out.microphone_mode, MicrophoneMode::CloseMicrophone);
  EXPECT_FALSE(m.device_request_json);
  EXPECT_FALSE(m.screen_out_data);
}

TEST(WireCodec, VolumeIsClampedBeforeNarrowing) {
  auto volumeOf = [](const std::string& v) {
    return wire::parseInbound(R"({"dialog_state_out": {"volume_percentage": )" + v + "}}")
        .dialog_state_out.volume_percentage;
  };
  EXPECT_EQ(volumeOf("4294967296"), 100);
  EXPECT_EQ(volumeOf("18446744073709551615"), 100);
  EXPECT_EQ(volumeOf("101"), 100);
  EXPECT_EQ(volumeOf("-5"), 0);
  EXPECT_EQ(volumeOf("-4294967296"), 0);
  EXPECT_EQ(volumeOf("55"), 55);
}

TEST(WireCodec, RejectsBadFrames) {
  EXPECT_THROW(wire::parseInbound("{nope"), json::parse_error);
  EXPECT_THROW(wire::parseInbound("[1]"), std::invalid_argument);
}

TEST(WireCodec, SummaryOmitsPayloads) {
  InboundMessage m;
  m.audio_out = AudioBytes(10, 0);
  m.dialog_state_out.microphone_mode = MicrophoneMode::DialogFollowOn;
  std::string s = wire::summarize(m);
  EXPECT_NE(s.find("audio_out=10B"), std::string::npos);
  EXPECT_NE(s.find("DIALOG_FOLLOW_ON"), std::string::npos);
}

TEST(TransportStatus, CloseCodes) {
  EXPECT_EQ(statusFromCloseCode(1000), StatusCode::Ok);
  EXPECT_EQ(statusFromCloseCode(1001), StatusCode::Unavailable);
  EXPECT_EQ(statusFromCloseCode(1006), StatusCode::Unavailable);
  EXPECT_EQ(statusFromCloseCode(1008), StatusCode::PermissionDenied);
  EXPECT_EQ(statusFromCloseCode(1011), StatusCode::Internal);
  EXPECT_EQ(statusFromCloseCode(4000), StatusCode::Unknown);
}

TEST(TransportStatus, HandshakeStatus) {
  EXPECT_EQ(statusFromHttpStatus(0), StatusCode::Unavailable);
  EXPECT_EQ(statusFromHttpStatus(401), StatusCode::Unauthenticated);
  EXPECT_EQ(statusFromHttpStatus(403), StatusCode::PermissionDenied);
  EXPECT_EQ(statusFromHttpStatus(503), StatusCode::Unavailable);
  EXPECT_EQ(statusFromHttpStatus(504), StatusCode::DeadlineExceeded);
  EXPECT_EQ(statusFromHttpStatus(418), StatusCode::Unknown);
}

TEST(WebSocketTransport, RefusedConnectionFailsTheCall) {
  std::ostringstream out, err;
  Context ctx(out, err);
  WebSocketTransport::Options opts;
  opts.endpoint = "wss://127.0.0.1:1/assist";
  opts.access_token = "token";
  WebSocketTransport transport(ctx, opts);

  std::unique_ptr<AssistCall> call = transport.open(std::chrono::seconds(10));
  ASSERT_NE(call, nullptr);
  try {
    call->read();
    FAIL() << "read() on a refused connection must throw";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.code(), StatusCode::Unavailable);
  }
  EXPECT_FALSE(call->write(OutboundMessage{}));
  call.reset();
  transport.stop();
}

TEST(WebSocketTransport, BadEndpointIsInvalidArgument) {
  std::ostringstream out, err;
  Context ctx(out, err);
  WebSocketTransport::Options opts;
  opts.endpoint = "not a uri";
  WebSocketTransport transport(ctx, opts);
  try {
    transport.open(std::chrono::seconds(1));
    FAIL() << "open() must reject a malformed endpoint";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.code(), StatusCode::InvalidArgument);
  }
}

} // namespace
