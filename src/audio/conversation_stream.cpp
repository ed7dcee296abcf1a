#include <voxturn/audio/conversation_stream.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace voxturn {

void applyVolume(AudioBytes& pcm, int volume_percentage) {
  const double scale = std::pow(2.0, volume_percentage / 100.0) - 1.0;
  for (size_t i = 0; i + 1 < pcm.size(); i += 2) {
    int16_t s = static_cast<int16_t>(pcm[i] | (pcm[i + 1] << 8));
    double v = std::clamp(s * scale, -32768.0, 32767.0);
    int16_t o = static_cast<int16_t>(v);
    pcm[i]     = static_cast<uint8_t>(o & 0xFF);
    pcm[i + 1] = static_cast<uint8_t>((o >> 8) & 0xFF);
  }
}

ConversationStream::ConversationStream(std::shared_ptr<AudioSource> source,
                                       std::shared_ptr<AudioSink> sink,
                                       int sample_rate,
                                       size_t iter_size)
: source_(std::move(source)), sink_(std::move(sink)),
  sample_rate_(sample_rate), iter_size_(iter_size ? iter_size : 3200) {
  if (!source_ || !sink_) throw std::invalid_argument("conversation stream needs a source and a sink");
}

ConversationStream::~ConversationStream() { close(); }

void ConversationStream::startRecording() {
  std::lock_guard<std::mutex> lk(mode_mtx_);
  if (closed_.load()) throw std::logic_error("audio channel is closed");
  if (mode_ == AudioMode::Recording) return;
  if (mode_ == AudioMode::Playing) {
    sink_->flush();
    sink_->stop();
  }
  mode_ = AudioMode::Recording;
  source_->start();
}

void ConversationStream::stopRecording() {
  std::lock_guard<std::mutex> lk(mode_mtx_);
  if (mode_ != AudioMode::Recording) return;
  source_->stop();
  mode_ = AudioMode::Idle;
}

std::optional<AudioBytes> ConversationStream::readChunk() {
  if (mode_ != AudioMode::Recording) return std::nullopt;
  AudioBytes data = source_->read(iter_size_);
  if (data.empty()) return std::nullopt;
  return data;
}

void ConversationStream::startPlayback() {
  std::lock_guard<std::mutex> lk(mode_mtx_);
  if (closed_.load()) throw std::logic_error("audio channel is closed");
  if (mode_ == AudioMode::Playing) return;
  if (mode_ == AudioMode::Recording) source_->stop();
  mode_ = AudioMode::Playing;
  pending_byte_.clear();
  sink_->start();
}

void ConversationStream::write(const AudioBytes& data) {
  std::lock_guard<std::mutex> lk(mode_mtx_);
  if (mode_ != AudioMode::Playing) throw std::logic_error("audio write while not playing");

  // keep whole samples: an odd trailing byte waits for the next chunk
  AudioBytes buf;
  buf.reserve(pending_byte_.size() + data.size());
  buf.insert(buf.end(), pending_byte_.begin(), pending_byte_.end());
  buf.insert(buf.end(), data.begin(), data.end());
  pending_byte_.clear();
  if (buf.size() % 2) {
    pending_byte_.push_back(buf.back());
    buf.pop_back();
  }
  if (buf.empty()) return;

  applyVolume(buf, volume_.load());
  sink_->write(buf);
}

void ConversationStream::stopPlayback() {
  std::lock_guard<std::mutex> lk(mode_mtx_);
  if (mode_ != AudioMode::Playing) return;
  sink_->flush();
  sink_->stop();
  pending_byte_.clear();
  mode_ = AudioMode::Idle;
}

void ConversationStream::setVolumePercentage(int volume) {
  volume_.store(std::max(0, std::min(100, volume)));
}

void ConversationStream::close() {
  if (closed_.exchange(true)) return;
  stopRecording();
  stopPlayback();
  source_->close();
  // one device may play both roles
  if (dynamic_cast<void*>(sink_.get()) != dynamic_cast<void*>(source_.get())) sink_->close();
}

} // namespace voxturn
