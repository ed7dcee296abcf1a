#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/assistant/response_state_machine.hpp>
#include <voxturn/assistant/retry_policy.hpp>
#include <voxturn/assistant/transport.hpp>
#include <voxturn/audio/audio_channel.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/core/messages.hpp>
#include <voxturn/display/screen_output.hpp>

namespace voxturn {

/**
 * One conversation with the assistant service.
 *
 * Owns the audio channel and the conversation state; turns are serialised.
 * Each attempt of a turn runs three parties concurrently:
 *   producer  RequestEncoder -> bounded queue   (blocks on audio capture)
 *   writer    bounded queue  -> call.write()    (blocks on send readiness)
 *   caller    call.read()    -> ResponseStateMachine
 * The audio channel is closed exactly once, when the session goes away.
 */
class ConversationSession {
public:
    static constexpr std::chrono::seconds kDefaultDeadline{185};
    static constexpr size_t kOutboundQueueDepth = 16;

    ConversationSession(Context& ctx,
                        TurnConfig config,
                        std::unique_ptr<AudioChannel> audio,
                        AssistTransport& transport,
                        DeviceActionDispatcher& dispatcher,
                        ScreenOutput* display = nullptr,
                        std::chrono::seconds deadline = kDefaultDeadline,
                        RetryPolicy retry = RetryPolicy());
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    // Send a voice request and play back the response.
    // Returns whether the service expects a follow-on turn.
    TurnOutcome runTurn();

    const ConversationState& state() const { return state_; }
    const TurnConfig& config() const { return config_; }
    AudioChannel& audio() { return *audio_; }

    void setTranscriptCallback(ResponseStateMachine::TranscriptCallback cb) {
        machine_.setTranscriptCallback(std::move(cb));
    }

private:
    TurnOutcome runAttempt();

    Context& ctx_;
    TurnConfig config_;
    std::unique_ptr<AudioChannel> audio_;
    AssistTransport& transport_;
    ResponseStateMachine machine_;
    std::chrono::seconds deadline_;
    RetryPolicy retry_;
    ConversationState state_;
    std::mutex turn_mtx_;
};

} // namespace voxturn
