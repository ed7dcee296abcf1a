#pragma once

#include <functional>
#include <string>
#include <vector>

#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/assistant/transport.hpp>
#include <voxturn/audio/audio_channel.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/core/messages.hpp>
#include <voxturn/display/screen_output.hpp>

namespace voxturn {

/**
 * Drains the inbound stream of one turn and drives the audio channel:
 *
 *   Recording --END_OF_UTTERANCE--> recording stopped
 *             --first audio_out---> Playing (barge-in also stops recording)
 *   end of stream --> pending device actions joined --> playback stopped
 *
 * Recording is started by the caller. Playback is stopped at the end even if
 * nothing was played.
 */
class ResponseStateMachine {
public:
    using TranscriptCallback = std::function<void(const std::string&)>;

    ResponseStateMachine(Context& ctx, DeviceActionDispatcher& dispatcher, ScreenOutput* display = nullptr);

    void setTranscriptCallback(TranscriptCallback cb) { on_transcript_ = std::move(cb); }

    TurnOutcome processTurn(InboundStream& inbound,
                            AudioChannel& audio,
                            ConversationState& state,
                            bool display_enabled);

private:
    void processMessage(const InboundMessage& resp,
                        AudioChannel& audio,
                        ConversationState& state,
                        bool display_enabled,
                        TurnOutcome& outcome,
                        std::vector<PendingAction>& pending);

    void joinPendingActions(std::vector<PendingAction>& pending);

    Context& ctx_;
    DeviceActionDispatcher& dispatcher_;
    ScreenOutput* display_;
    TranscriptCallback on_transcript_;
};

} // namespace voxturn
