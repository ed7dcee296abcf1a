#pragma once

#include <memory>
#include <string>

#include <voxturn/core/context.hpp>

namespace voxturn {

// Speaks a sentence locally, outside the assistant audio stream.
class TextToSpeech {
public:
    virtual ~TextToSpeech() = default;
    virtual void say(const std::string& text) = 0;
};

// Runs an external synthesizer, e.g. "espeak-ng -v ja {text}" or
// "pico2wave -w /tmp/s.wav {text} && aplay /tmp/s.wav". {text} is shell-quoted.
// Throws std::runtime_error when the command exits non-zero.
class CommandTextToSpeech : public TextToSpeech {
public:
    CommandTextToSpeech(Context& ctx, std::string command_template);

    void say(const std::string& text) override;

    std::string render(const std::string& text) const;

private:
    Context& ctx_;
    std::string template_;
};

// Prints what would have been spoken.
class LogTextToSpeech : public TextToSpeech {
public:
    explicit LogTextToSpeech(Context& ctx) : ctx_(ctx) {}
    void say(const std::string& text) override { ctx_.log().info("TTS", "🔊 " + text); }

private:
    Context& ctx_;
};

std::unique_ptr<TextToSpeech> makeTextToSpeech(Context& ctx, const std::string& command_template);

} // namespace voxturn
