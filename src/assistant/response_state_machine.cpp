#include <voxturn/assistant/response_state_machine.hpp>

namespace voxturn {

static std::string join_transcripts(const std::vector<std::string>& parts) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += ' ';
    out += parts[i];
  }
  return out;
}

ResponseStateMachine::ResponseStateMachine(Context& ctx, DeviceActionDispatcher& dispatcher, ScreenOutput* display)
: ctx_(ctx), dispatcher_(dispatcher), display_(display) {}

TurnOutcome ResponseStateMachine::processTurn(InboundStream& inbound,
                                              AudioChannel& audio,
                                              ConversationState& state,
                                              bool display_enabled) {
  TurnOutcome outcome;
  std::vector<PendingAction> pending;

  while (auto resp = inbound.read()) {
    processMessage(*resp, audio, state, display_enabled, outcome, pending);
  }

  if (!pending.empty()) {
    ctx_.log().info("Turn", "Waiting for device executions to complete.");
    joinPendingActions(pending);
  }

  ctx_.log().info("Turn", "Finished playing assistant response.");
  audio.stopPlayback();
  return outcome;
}

void ResponseStateMachine::processMessage(const InboundMessage& resp,
                                          AudioChannel& audio,
                                          ConversationState& state,
                                          bool display_enabled,
                                          TurnOutcome& outcome,
                                          std::vector<PendingAction>& pending) {
  auto& log = ctx_.log();

  if (resp.event_type == EventType::EndOfUtterance) {
    log.info("Turn", "End of audio request detected.");
    log.info("Turn", "Stopping recording.");
    audio.stopRecording();
  }

  if (!resp.speech_results.empty()) {
    std::string transcript = join_transcripts(resp.speech_results);
    log.info("Turn", "Transcript of user request: \"" + transcript + "\".");
    if (on_transcript_) on_transcript_(transcript);
  }

  if (!resp.audio_out.empty()) {
    if (!audio.playing()) {
      // barge-in: the service speaking always ends the recording
      audio.stopRecording();
      audio.startPlayback();
      log.info("Turn", "Playing assistant response.");
    }
    audio.write(resp.audio_out);
    ctx_.counters().audio_bytes_out += resp.audio_out.size();
  }

  const DialogStateOut& dialog = resp.dialog_state_out;
  if (dialog.conversation_state) {
    log.debug("Turn", "Updating conversation state.");
    state.continuation_token = dialog.conversation_state;
  }
  if (dialog.volume_percentage != 0) {
    log.info("Turn", "Setting volume to " + std::to_string(dialog.volume_percentage) + "%");
    audio.setVolumePercentage(dialog.volume_percentage);
  }
  if (dialog.microphone_mode == MicrophoneMode::DialogFollowOn) {
    outcome.continue_conversation = true;
    log.info("Turn", "Expecting follow-on query from user.");
  } else if (dialog.microphone_mode == MicrophoneMode::CloseMicrophone) {
    outcome.continue_conversation = false;
  }
  if (!dialog.supplemental_display_text.empty()) {
    log.info("Turn", "Assistant: " + dialog.supplemental_display_text);
  }

  if (resp.device_request_json) {
    auto fs = dispatcher_.handleRequest(*resp.device_request_json);
    pending.insert(pending.end(), fs.begin(), fs.end());
  }

  if (display_enabled && display_ && resp.screen_out_data) {
    try {
      display_->display(*resp.screen_out_data);
    } catch (const std::exception& e) {
      log.warn("Display", std::string("screen_out not shown: ") + e.what());
    }
  }
}

void ResponseStateMachine::joinPendingActions(std::vector<PendingAction>& pending) {
  for (auto& action : pending) {
    action.wait();
    try {
      action.get();
      ctx_.log().debug("Device", action.name() + " done");
    } catch (const std::exception& e) {
      ctx_.counters().failed_actions++;
      ctx_.log().error("Device", action.name() + " failed: " + e.what());
    } catch (...) {
      ctx_.counters().failed_actions++;
      ctx_.log().error("Device", action.name() + " failed: unknown exception");
    }
  }
  pending.clear();
}

} // namespace voxturn
