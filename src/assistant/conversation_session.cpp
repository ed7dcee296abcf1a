#include <voxturn/assistant/conversation_session.hpp>

#include <exception>
#include <thread>

#include <voxturn/assistant/request_encoder.hpp>
#include <voxturn/core/bounded_queue.hpp>
#include <voxturn/core/errors.hpp>

namespace voxturn {

static std::string describe_config(const AssistConfig& c) {
  return "lang=" + c.language_code +
         " model=" + c.device_model_id +
         " device=" + c.device_id +
         " rate=" + std::to_string(c.sample_rate_in) +
         " volume=" + std::to_string(c.volume_percentage) +
         " new_conversation=" + (c.is_new_conversation ? "true" : "false") +
         " state=" + (c.conversation_state ? std::to_string(c.conversation_state->size()) + "B" : "none");
}

namespace {

// Outbound side of one attempt: encoder -> queue -> call.
// Stopping it stops recording, so a producer blocked on capture wakes up.
class OutboundPump {
public:
  OutboundPump(Context& ctx, RequestEncoder& encoder, AudioChannel& audio, AssistCall& call)
  : ctx_(ctx), encoder_(encoder), audio_(audio), call_(call),
    queue_(ConversationSession::kOutboundQueueDepth) {
    // Config goes in before any thread runs: it is first on the wire no matter what
    if (auto first = encoder_.next()) queue_.push(std::move(*first));
    producer_ = std::thread([this]{ produce(); });
    writer_   = std::thread([this]{ drain(); });
  }

  ~OutboundPump() { stop(false); }

  void stop(bool abort) {
    if (stopped_) return;
    stopped_ = true;
    audio_.stopRecording();
    if (abort) call_.cancel();
    queue_.close();
    if (producer_.joinable()) producer_.join();
    if (writer_.joinable()) writer_.join();
  }

  std::exception_ptr producerError() const { return producer_error_; }

private:
  void produce() {
    try {
      while (auto msg = encoder_.next()) {
        ctx_.counters().audio_bytes_in += msg->audio_in.size();
        if (!queue_.push(std::move(*msg))) break;
      }
      ctx_.log().debug("Session", "Reached end of AssistRequest iteration.");
    } catch (const std::exception& e) {
      ctx_.log().error("Session", std::string("audio capture failed: ") + e.what());
      producer_error_ = std::current_exception();
    }
    queue_.close();
  }

  void drain() {
    OutboundMessage msg;
    bool writable = true;
    while (queue_.pop(msg)) {
      if (!writable) continue;
      if (!call_.write(msg)) {
        ctx_.log().debug("Session", "call no longer writable, dropping outbound audio");
        writable = false;
      }
    }
    if (writable) call_.writesDone();
  }

  Context& ctx_;
  RequestEncoder& encoder_;
  AudioChannel& audio_;
  AssistCall& call_;
  BoundedQueue<OutboundMessage> queue_;
  std::thread producer_;
  std::thread writer_;
  std::exception_ptr producer_error_;
  bool stopped_ = false;
};

} // namespace

ConversationSession::ConversationSession(Context& ctx,
                                         TurnConfig config,
                                         std::unique_ptr<AudioChannel> audio,
                                         AssistTransport& transport,
                                         DeviceActionDispatcher& dispatcher,
                                         ScreenOutput* display,
                                         std::chrono::seconds deadline,
                                         RetryPolicy retry)
: ctx_(ctx),
  config_(std::move(config)),
  audio_(std::move(audio)),
  transport_(transport),
  machine_(ctx, dispatcher, display),
  deadline_(deadline),
  retry_(std::move(retry)) {
  if (!audio_) throw ConfigurationError("conversation session needs an audio channel");
  // Force reset of first conversation.
  state_.is_new_conversation = true;
  audio_->setVolumePercentage(config_.volume_percentage);
}

ConversationSession::~ConversationSession() {
  audio_->close();
}

TurnOutcome ConversationSession::runTurn() {
  std::lock_guard<std::mutex> lk(turn_mtx_);
  ctx_.counters().turns++;
  return retry_.execute([this]{ return runAttempt(); });
}

TurnOutcome ConversationSession::runAttempt() {
  ctx_.counters().attempts++;

  audio_->startRecording();
  ctx_.log().info("Session", "Recording audio request.");

  std::unique_ptr<AssistCall> call;
  try {
    call = transport_.open(deadline_);
  } catch (const std::exception&) {
    audio_->stopRecording();
    throw;
  }

  RequestEncoder encoder(config_, state_, *audio_);
  ctx_.log().debug("Session", "AssistConfig " + describe_config(encoder.assistConfig()));

  OutboundPump pump(ctx_, encoder, *audio_, *call);
  TurnOutcome outcome;
  try {
    outcome = machine_.processTurn(*call, *audio_, state_, config_.display_enabled);
  } catch (const std::exception& e) {
    // aborted: discard the rest of the turn and reset the channel
    ctx_.log().error("Session", std::string("turn aborted: ") + e.what());
    pump.stop(true);
    audio_->stopPlayback();
    throw;
  }
  pump.stop(false);

  if (pump.producerError()) {
    ctx_.log().warn("Session", "audio input ended early this turn");
  }
  return outcome;
}

} // namespace voxturn
