#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxturn {

using AudioBytes = std::vector<uint8_t>;

// ======== Session state carried across turns ========

struct ConversationState {
    std::optional<std::string> continuation_token; // opaque, forwarded verbatim
    bool is_new_conversation = true;
};

struct TurnConfig {
    std::string language_code = "en-US";
    std::string device_model_id;
    std::string device_id;
    int sample_rate = 16000;
    int volume_percentage = 50;
    bool display_enabled = false;
};

struct TurnOutcome {
    bool continue_conversation = false;
};

// ======== Outbound (client -> service) ========

struct AssistConfig {
    std::string language_code;
    std::string device_model_id;
    std::string device_id;
    int sample_rate_in = 16000;
    int sample_rate_out = 16000;
    int volume_percentage = 50;
    std::optional<std::string> conversation_state;
    bool is_new_conversation = false;
    bool screen_mode_playing = false;
};

struct OutboundMessage {
    enum class Kind { Config, AudioIn };

    Kind kind = Kind::AudioIn;
    AssistConfig config;   // Kind::Config only
    AudioBytes audio_in;   // Kind::AudioIn only

    static OutboundMessage makeConfig(AssistConfig cfg) {
        OutboundMessage m;
        m.kind = Kind::Config;
        m.config = std::move(cfg);
        return m;
    }
    static OutboundMessage makeAudio(AudioBytes data) {
        OutboundMessage m;
        m.kind = Kind::AudioIn;
        m.audio_in = std::move(data);
        return m;
    }
};

// ======== Inbound (service -> client) ========

enum class EventType { None, EndOfUtterance };

enum class MicrophoneMode { Unspecified, DialogFollowOn, CloseMicrophone };

struct DialogStateOut {
    std::optional<std::string> conversation_state;
    int volume_percentage = 0; // 0 = unset
    MicrophoneMode microphone_mode = MicrophoneMode::Unspecified;
    std::string supplemental_display_text;
};

struct InboundMessage {
    EventType event_type = EventType::None;
    std::vector<std::string> speech_results;
    AudioBytes audio_out;
    DialogStateOut dialog_state_out;
    std::optional<std::string> device_request_json;
    std::optional<std::string> screen_out_data;
};

} // namespace voxturn
