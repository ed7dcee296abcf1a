#pragma once

#include <optional>

#include <voxturn/audio/audio_channel.hpp>
#include <voxturn/core/messages.hpp>

namespace voxturn {

/**
 * Produces the outbound messages of one turn: the Config first, then one
 * AudioIn per captured chunk until recording stops or the input runs dry.
 *
 * The Config is built from the session state at construction time and the
 * "new conversation" flag is cleared right away, so later turns continue the
 * same conversation. Single pass: once next() returned nothing it keeps
 * returning nothing.
 */
class RequestEncoder {
public:
    RequestEncoder(const TurnConfig& config, ConversationState& state, AudioChannel& audio);

    std::optional<OutboundMessage> next();

    const AssistConfig& assistConfig() const { return config_; }

private:
    AudioChannel& audio_;
    AssistConfig config_;
    bool config_sent_ = false;
    bool finished_ = false;
};

} // namespace voxturn
