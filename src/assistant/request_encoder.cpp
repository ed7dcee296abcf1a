#include <voxturn/assistant/request_encoder.hpp>

namespace voxturn {

static AssistConfig build_assist_config(const TurnConfig& config,
                                        const ConversationState& state,
                                        const AudioChannel& audio) {
  AssistConfig c;
  c.language_code     = config.language_code;
  c.device_model_id   = config.device_model_id;
  c.device_id         = config.device_id;
  // channel values, so a volume set by the service last turn is reported back
  c.sample_rate_in    = audio.sampleRate();
  c.sample_rate_out   = audio.sampleRate();
  c.volume_percentage = audio.volumePercentage();
  c.conversation_state  = state.continuation_token;
  c.is_new_conversation = state.is_new_conversation;
  c.screen_mode_playing = config.display_enabled;
  return c;
}

RequestEncoder::RequestEncoder(const TurnConfig& config, ConversationState& state, AudioChannel& audio)
: audio_(audio),
  config_(build_assist_config(config, state, audio)) {
  // continue the current conversation with later requests
  state.is_new_conversation = false;
}

std::optional<OutboundMessage> RequestEncoder::next() {
  if (!config_sent_) {
    config_sent_ = true;
    return OutboundMessage::makeConfig(config_);
  }
  if (finished_) return std::nullopt;

  if (!audio_.recording()) { finished_ = true; return std::nullopt; }
  auto chunk = audio_.readChunk();
  if (!chunk) { finished_ = true; return std::nullopt; }
  return OutboundMessage::makeAudio(std::move(*chunk));
}

} // namespace voxturn
