#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include <voxturn/audio/conversation_stream.hpp>

namespace voxturn {

/**
 * Reads a mono 16-bit PCM WAV file as if it were a microphone: reads are
 * paced to real time and, once the file is exhausted, silence is returned
 * until recording stops, so the service can detect the end of the utterance.
 */
class WavFileSource : public AudioSource {
public:
    WavFileSource(const std::string& path, int expected_sample_rate, bool realtime = true);

    void start() override;
    void stop() override;
    AudioBytes read(size_t size) override;
    void close() override;

    int sampleRate() const { return sample_rate_; }
    uint32_t dataBytes() const { return data_bytes_; }

private:
    std::ifstream in_;
    int sample_rate_ = 0;
    uint32_t data_bytes_ = 0;
    uint32_t consumed_ = 0;
    bool realtime_;
    bool stopped_ = false;
    uint64_t bytes_since_start_ = 0;
    std::chrono::steady_clock::time_point started_at_;
    std::mutex mtx_;
};

// Writes response audio to a mono 16-bit PCM WAV file. Sizes in the header
// are patched on flush/close.
class WavFileSink : public AudioSink {
public:
    WavFileSink(const std::string& path, int sample_rate);
    ~WavFileSink() override;

    void write(const AudioBytes& data) override;
    void flush() override;
    void close() override;

    uint32_t dataBytes() const { return data_bytes_; }

private:
    void patchHeader();

    std::ofstream out_;
    int sample_rate_;
    uint32_t data_bytes_ = 0;
    std::mutex mtx_;
};

} // namespace voxturn
