#pragma once

#include <optional>

#include <voxturn/core/messages.hpp>

namespace voxturn {

enum class AudioMode { Idle, Recording, Playing };

/**
 * Bidirectional audio transport used by a conversation turn.
 * Implementations must be safe to drive from the turn's producer thread
 * (readChunk) and the inbound thread (everything else) at the same time.
 */
class AudioChannel {
public:
    virtual ~AudioChannel() = default;

    virtual void startRecording() = 0;
    virtual void stopRecording() = 0;       // idempotent

    // Blocks for the next input chunk. Empty optional once recording stopped
    // or the source is exhausted.
    virtual std::optional<AudioBytes> readChunk() = 0;

    virtual void startPlayback() = 0;
    virtual void write(const AudioBytes& data) = 0;
    virtual void stopPlayback() = 0;        // idempotent

    virtual AudioMode mode() const = 0;
    bool recording() const { return mode() == AudioMode::Recording; }
    bool playing() const { return mode() == AudioMode::Playing; }

    virtual int sampleRate() const = 0;
    virtual int volumePercentage() const = 0;
    virtual void setVolumePercentage(int volume) = 0;

    virtual void close() = 0;
};

} // namespace voxturn
