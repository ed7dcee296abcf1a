#include <voxturn/tts/text_to_speech.hpp>

#include <stdexcept>

#include <voxturn/core/shell.hpp>

namespace voxturn {

CommandTextToSpeech::CommandTextToSpeech(Context& ctx, std::string command_template)
: ctx_(ctx), template_(std::move(command_template)) {}

std::string CommandTextToSpeech::render(const std::string& text) const {
  static const std::string kPlaceholder = "{text}";
  std::string cmd = template_;
  auto pos = cmd.find(kPlaceholder);
  if (pos == std::string::npos) return cmd + " " + shellQuote(text);
  while (pos != std::string::npos) {
    std::string quoted = shellQuote(text);
    cmd.replace(pos, kPlaceholder.size(), quoted);
    pos = cmd.find(kPlaceholder, pos + quoted.size());
  }
  return cmd;
}

void CommandTextToSpeech::say(const std::string& text) {
  ctx_.log().info("TTS", "🔊 " + text);
  int ret = runShell(render(text));
  if (ret != 0) throw std::runtime_error("text-to-speech command exited with code " + std::to_string(ret));
}

std::unique_ptr<TextToSpeech> makeTextToSpeech(Context& ctx, const std::string& command_template) {
  if (command_template.empty()) return std::make_unique<LogTextToSpeech>(ctx);
  return std::make_unique<CommandTextToSpeech>(ctx, command_template);
}

} // namespace voxturn
