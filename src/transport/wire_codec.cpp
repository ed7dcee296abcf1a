#include <voxturn/transport/wire_codec.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include <websocketpp/base64/base64.hpp>

using json = nlohmann::json;

namespace voxturn {
namespace wire {

static std::string b64(const AudioBytes& bytes) {
  return websocketpp::base64_encode(bytes.data(), bytes.size());
}

static AudioBytes unb64_bytes(const std::string& s) {
  std::string raw = websocketpp::base64_decode(s);
  return AudioBytes(raw.begin(), raw.end());
}

static const json* field(const json& j, const char* name) {
  if (!j.is_object()) return nullptr;
  auto it = j.find(name);
  return it == j.end() ? nullptr : &*it;
}

static std::string string_field(const json& j, const char* name) {
  const json* f = field(j, name);
  return (f && f->is_string()) ? f->get<std::string>() : std::string();
}

json encodeOutbound(const OutboundMessage& msg) {
  if (msg.kind == OutboundMessage::Kind::AudioIn) {
    return { {"audio_in", b64(msg.audio_in)} };
  }

  const AssistConfig& c = msg.config;
  json dialog = {
    {"language_code", c.language_code},
    {"is_new_conversation", c.is_new_conversation}
  };
  if (c.conversation_state) {
    dialog["conversation_state"] = websocketpp::base64_encode(*c.conversation_state);
  }

  json cfg = {
    {"audio_in_config",  {{"encoding", "LINEAR16"}, {"sample_rate_hertz", c.sample_rate_in}}},
    {"audio_out_config", {{"encoding", "LINEAR16"}, {"sample_rate_hertz", c.sample_rate_out},
                          {"volume_percentage", c.volume_percentage}}},
    {"dialog_state_in",  dialog},
    {"device_config",    {{"device_id", c.device_id}, {"device_model_id", c.device_model_id}}}
  };
  if (c.screen_mode_playing) {
    cfg["screen_out_config"] = { {"screen_mode", "PLAYING"} };
  }
  return { {"config", cfg} };
}

json encodeAudioInDone() {
  return { {"audio_in_done", true} };
}

InboundMessage parseInbound(const std::string& payload) {
  return decodeInbound(json::parse(payload));
}

InboundMessage decodeInbound(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("inbound frame is not a JSON object");

  InboundMessage m;

  if (string_field(j, "event_type") == "END_OF_UTTERANCE") m.event_type = EventType::EndOfUtterance;

  if (const json* results = field(j, "speech_results")) {
    if (results->is_array()) {
      for (const auto& r : *results) {
        std::string t = string_field(r, "transcript");
        if (!t.empty()) m.speech_results.push_back(t);
      }
    }
  }

  if (const json* audio = field(j, "audio_out")) {
    std::string data = string_field(*audio, "audio_data");
    if (!data.empty()) m.audio_out = unb64_bytes(data);
  }

  if (const json* dialog = field(j, "dialog_state_out")) {
    DialogStateOut& d = m.dialog_state_out;
    std::string state = string_field(*dialog, "conversation_state");
    if (!state.empty()) d.conversation_state = websocketpp::base64_decode(state);
    if (const json* v = field(*dialog, "volume_percentage")) {
      // clamp before narrowing; 0 stays "unset"
      if (v->is_number_unsigned()) {
        d.volume_percentage = static_cast<int>(std::min<uint64_t>(v->get<uint64_t>(), 100));
      } else if (v->is_number_integer()) {
        d.volume_percentage = static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(v->get<int64_t>(), 100)));
      }
    }
    std::string mode = string_field(*dialog, "microphone_mode");
    if (mode == "DIALOG_FOLLOW_ON")      d.microphone_mode = MicrophoneMode::DialogFollowOn;
    else if (mode == "CLOSE_MICROPHONE") d.microphone_mode = MicrophoneMode::CloseMicrophone;
    d.supplemental_display_text = string_field(*dialog, "supplemental_display_text");
  }

  if (const json* action = field(j, "device_action")) {
    std::string req = string_field(*action, "device_request_json");
    if (!req.empty()) m.device_request_json = req;
  }

  if (const json* screen = field(j, "screen_out")) {
    std::string data = string_field(*screen, "data");
    if (!data.empty()) m.screen_out_data = websocketpp::base64_decode(data);
  }

  return m;
}

std::string summarize(const InboundMessage& m) {
  std::string s = "AssistResponse{";
  if (m.event_type == EventType::EndOfUtterance) s += " event=END_OF_UTTERANCE";
  if (!m.speech_results.empty()) s += " speech_results=" + std::to_string(m.speech_results.size());
  if (!m.audio_out.empty()) s += " audio_out=" + std::to_string(m.audio_out.size()) + "B";
  const DialogStateOut& d = m.dialog_state_out;
  if (d.conversation_state) s += " conversation_state=" + std::to_string(d.conversation_state->size()) + "B";
  if (d.volume_percentage) s += " volume=" + std::to_string(d.volume_percentage);
  if (d.microphone_mode == MicrophoneMode::DialogFollowOn) s += " mic=DIALOG_FOLLOW_ON";
  if (d.microphone_mode == MicrophoneMode::CloseMicrophone) s += " mic=CLOSE_MICROPHONE";
  if (m.device_request_json) s += " device_action";
  if (m.screen_out_data) s += " screen_out=" + std::to_string(m.screen_out_data->size()) + "B";
  return s + " }";
}

} // namespace wire
} // namespace voxturn
