#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

#include <voxturn/audio/audio_channel.hpp>

namespace voxturn {

// Where request audio comes from (LINEAR16 mono).
class AudioSource {
public:
    virtual ~AudioSource() = default;
    virtual void start() {}
    virtual void stop() {}
    // Blocks for up to `size` bytes. Empty result means the source is exhausted
    // (or was stopped).
    virtual AudioBytes read(size_t size) = 0;
    virtual void close() {}
};

// Where response audio goes.
class AudioSink {
public:
    virtual ~AudioSink() = default;
    virtual void start() {}
    virtual void write(const AudioBytes& data) = 0;
    virtual void flush() {}
    virtual void stop() {}
    virtual void close() {}
};

/**
 * AudioChannel built from a source and a sink.
 * Recording and playback are mutually exclusive; starting playback while
 * recording stops the recording first. Playback audio is scaled by the
 * current volume.
 */
class ConversationStream : public AudioChannel {
public:
    static constexpr int kDefaultVolume = 50;

    ConversationStream(std::shared_ptr<AudioSource> source,
                       std::shared_ptr<AudioSink> sink,
                       int sample_rate = 16000,
                       size_t iter_size = 3200);
    ~ConversationStream() override;

    void startRecording() override;
    void stopRecording() override;
    std::optional<AudioBytes> readChunk() override;

    void startPlayback() override;
    void write(const AudioBytes& data) override;
    void stopPlayback() override;

    AudioMode mode() const override { return mode_.load(); }

    int sampleRate() const override { return sample_rate_; }
    int volumePercentage() const override { return volume_.load(); }
    void setVolumePercentage(int volume) override;

    void close() override;
    bool isClosed() const { return closed_.load(); }

private:
    std::shared_ptr<AudioSource> source_;
    std::shared_ptr<AudioSink> sink_;
    int sample_rate_;
    size_t iter_size_;
    std::atomic<AudioMode> mode_{AudioMode::Idle};
    std::atomic<int> volume_{kDefaultVolume};
    std::atomic<bool> closed_{false};
    std::mutex mode_mtx_;
    AudioBytes pending_byte_; // odd trailing byte carried to the next write
};

// Scales 16-bit little endian PCM in place by 2^(volume/100) - 1.
void applyVolume(AudioBytes& pcm16le, int volume_percentage);

} // namespace voxturn
