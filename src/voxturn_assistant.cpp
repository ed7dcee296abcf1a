#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <csignal>
#include <signal.h>

#include <voxturn/actions/action_executor.hpp>
#include <voxturn/actions/builtin_commands.hpp>
#include <voxturn/actions/commit_report.hpp>
#include <voxturn/actions/command_registry.hpp>
#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/assistant/conversation_session.hpp>
#include <voxturn/assistant/retry_policy.hpp>
#include <voxturn/audio/conversation_stream.hpp>
#include <voxturn/config/runtime_config.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/core/errors.hpp>
#include <voxturn/display/screen_output.hpp>
#include <voxturn/hardware/device_hardware.hpp>
#include <voxturn/transport/http_client.hpp>
#include <voxturn/transport/websocket_transport.hpp>
#include <voxturn/tts/text_to_speech.hpp>
#include "audio/udp_audio.hpp"
#include "audio/wav_file.hpp"

using namespace voxturn;

static std::atomic<bool> shutdown_requested{false};

static void on_signal(int) { shutdown_requested = true; }

// No SA_RESTART: a blocked read of the Enter key returns so the loop can exit.
static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static std::unique_ptr<AudioChannel> make_audio(Context& ctx, const RuntimeConfig& cfg) {
  std::shared_ptr<AudioSource> source;
  std::shared_ptr<AudioSink> sink;

  if (!cfg.input_audio_file.empty()) {
    source = std::make_shared<WavFileSource>(cfg.input_audio_file, cfg.sample_rate);
    ctx.log().info("Init", "Microphone: WAV file " + cfg.input_audio_file);
  } else {
    UdpMulticastSource::Options mic;
    mic.group_ip = cfg.mic_mcast_ip;
    mic.port = cfg.mic_mcast_port;
    mic.iface_name = cfg.mic_mcast_iface;
    source = std::make_shared<UdpMulticastSource>(ctx, mic);
    ctx.log().info("Init", "Microphone: multicast " + cfg.mic_mcast_ip + ":" + std::to_string(cfg.mic_mcast_port) +
                           " via iface=" + cfg.mic_mcast_iface);
  }

  if (!cfg.output_audio_file.empty()) {
    sink = std::make_shared<WavFileSink>(cfg.output_audio_file, cfg.sample_rate);
    ctx.log().info("Init", "Speaker: WAV file " + cfg.output_audio_file);
  } else {
    sink = std::make_shared<UdpSink>(ctx, cfg.speaker_host, cfg.speaker_port);
  }

  return std::make_unique<ConversationStream>(source, sink, cfg.sample_rate, static_cast<size_t>(cfg.iter_size));
}

int main(int argc, char **argv) {
  Context ctx;
  install_signal_handlers();

  try {
    // process env > config/runtime.env > defaults, then flags
    loadRuntimeEnv(findProjectConfig("runtime.env"), ctx.log());
    RuntimeConfig cfg = RuntimeConfig::fromEnvironment();
    cfg.applyCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (cfg.help) { std::cout << RuntimeConfig::usage() << std::endl; return 0; }

    ctx.log().setVerbose(cfg.verbose);
    cfg.loadDeviceIdentity(ctx.log());
    cfg.loadAccessToken(ctx.log());
    cfg.validate();

    std::cout << "=== voxturn assistant ===\n";
    ctx.log().info("Init", "Endpoint " + cfg.endpoint + " | lang " + cfg.language_code +
                           " | device " + cfg.device_id + " (" + cfg.device_model_id + ")");

    SysfsHardware::Paths hw_paths;
    hw_paths.temperature = cfg.sensor_temperature;
    hw_paths.humidity = cfg.sensor_humidity;
    hw_paths.pressure = cfg.sensor_pressure;
    hw_paths.light = cfg.sensor_light;
    hw_paths.led = cfg.indicator_led;
    std::unique_ptr<DeviceHardware> hardware = makeHardware(ctx, hw_paths);
    std::unique_ptr<TextToSpeech> tts = makeTextToSpeech(ctx, cfg.tts_command);
    std::unique_ptr<HttpClient> http;

    ActionExecutor executor;
    DeviceActionDispatcher dispatcher(ctx, cfg.device_id, executor);
    registerBuiltinCommands(dispatcher, *hardware, *tts, ctx);
    if (!cfg.commit_report_url.empty()) {
      CurlHttpClient::Options http_opts;
      http_opts.user = cfg.commit_report_user;
      http_opts.password = cfg.commit_report_password;
      http_opts.verify_peer = cfg.commit_report_tls_verify;
      http = std::make_unique<CurlHttpClient>(http_opts);

      CommitReportOptions report;
      report.url = cfg.commit_report_url;
      report.sheet_id = cfg.commit_report_sheet_id;
      report.github_target = cfg.commit_report_target;
      registerCommitReportCommand(dispatcher, *http, *tts, ctx, report);
    }
    if (!cfg.device_actions_yaml.empty()) {
      registerExecCommands(dispatcher, loadExecCommands(cfg.device_actions_yaml), *tts, ctx);
    }
    ctx.log().debug("Init", "Device commands: " + std::to_string(dispatcher.commandNames().size()));

    std::unique_ptr<HtmlFileDisplay> display;
    if (cfg.display) display = std::make_unique<HtmlFileDisplay>(ctx, cfg.display_file, cfg.display_viewer);

    WebSocketTransport::Options ws;
    ws.endpoint = cfg.endpoint;
    ws.access_token = cfg.access_token;
    ws.verify_peer = cfg.tls_verify;
    ws.ca_file = cfg.ca_file;
    WebSocketTransport transport(ctx, ws);
    if (!transport.start()) throw TransportError(StatusCode::Unavailable, "failed to start websocket client");

    {
      ConversationSession session(ctx, cfg.turnConfig(), make_audio(ctx, cfg), transport, dispatcher,
                                  display.get(), cfg.deadline(),
                                  RetryPolicy(3, classifyTransportFailure, &ctx));

      auto run_turn = [&]() {
        hardware->setIndicator(true);
        try {
          TurnOutcome outcome = session.runTurn();
          hardware->setIndicator(false);
          return outcome;
        } catch (...) {
          hardware->setIndicator(false);
          throw;
        }
      };

      if (cfg.singleTurn()) {
        // If file arguments are supplied: exit after the first turn of the conversation.
        run_turn();
      } else {
        // If no file arguments supplied: keep recording voice requests using
        // the microphone and playing back assistant response using the speaker.
        bool wait_for_user_trigger = true;
        while (!shutdown_requested) {
          if (wait_for_user_trigger) {
            std::cout << "Press Enter to send a new request... (Ctrl-C to quit)" << std::endl;
            std::string line;
            if (!std::getline(std::cin, line)) break;
          }
          if (shutdown_requested) break;
          TurnOutcome outcome = run_turn();
          // wait for user trigger if there is no follow-up turn in the conversation.
          wait_for_user_trigger = !outcome.continue_conversation;
          if (cfg.once && !outcome.continue_conversation) break;
        }
        if (shutdown_requested) ctx.log().info("Signal", "Shutting down gracefully...");
      }
    }

    transport.stop();
    executor.shutdown();
    ctx.printCounters();
    ctx.log().info("Shutdown", "✅ Graceful shutdown complete");
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[Fatal Error] " << e.what() << "\n";
    ctx.printCounters();
    return 1;
  }
}
