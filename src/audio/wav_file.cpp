#include "audio/wav_file.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace voxturn {

static uint32_t read_u32(const char* p) {
  return uint32_t(uint8_t(p[0])) | (uint32_t(uint8_t(p[1])) << 8) |
         (uint32_t(uint8_t(p[2])) << 16) | (uint32_t(uint8_t(p[3])) << 24);
}

static uint16_t read_u16(const char* p) {
  return uint16_t(uint8_t(p[0]) | (uint8_t(p[1]) << 8));
}

// Helper to write little-endian values
template<typename T>
static void write_le(std::ofstream& stream, T value) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    char b = static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
    stream.write(&b, 1);
  }
}

// ---------- source ----------

WavFileSource::WavFileSource(const std::string& path, int expected_sample_rate, bool realtime)
: in_(path, std::ios::binary), realtime_(realtime) {
  if (!in_) throw std::runtime_error("cannot open WAV file: " + path);

  char riff[12];
  if (!in_.read(riff, 12) || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
    throw std::runtime_error("not a RIFF/WAVE file: " + path);
  }

  bool have_fmt = false;
  char hdr[8];
  while (in_.read(hdr, 8)) {
    uint32_t chunk_size = read_u32(hdr + 4);
    if (std::memcmp(hdr, "fmt ", 4) == 0) {
      char fmt[16];
      if (chunk_size < 16 || !in_.read(fmt, 16)) throw std::runtime_error("truncated fmt chunk: " + path);
      uint16_t format   = read_u16(fmt);
      uint16_t channels = read_u16(fmt + 2);
      sample_rate_      = static_cast<int>(read_u32(fmt + 4));
      uint16_t bits     = read_u16(fmt + 14);
      if (format != 1 || channels != 1 || bits != 16) {
        throw std::runtime_error("only mono 16-bit PCM WAV is supported: " + path);
      }
      in_.seekg(chunk_size - 16 + (chunk_size & 1), std::ios::cur);
      have_fmt = true;
    } else if (std::memcmp(hdr, "data", 4) == 0) {
      if (!have_fmt) throw std::runtime_error("data chunk before fmt chunk: " + path);
      data_bytes_ = chunk_size;
      break;
    } else {
      in_.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
    }
  }
  if (!have_fmt || !in_) throw std::runtime_error("no audio data in WAV file: " + path);
  if (expected_sample_rate > 0 && sample_rate_ != expected_sample_rate) {
    throw std::runtime_error("WAV sample rate " + std::to_string(sample_rate_) +
                             " Hz does not match " + std::to_string(expected_sample_rate) + " Hz");
  }
}

void WavFileSource::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  stopped_ = false;
  bytes_since_start_ = 0;
  started_at_ = std::chrono::steady_clock::now();
}

void WavFileSource::stop() {
  std::lock_guard<std::mutex> lk(mtx_);
  stopped_ = true;
}

AudioBytes WavFileSource::read(size_t size) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (stopped_) return {};

  AudioBytes out(size, 0); // silence once the file is exhausted
  size_t avail = std::min<size_t>(size, data_bytes_ - consumed_);
  if (avail && in_.is_open()) {
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(avail));
    consumed_ += static_cast<uint32_t>(in_.gcount());
  }
  bytes_since_start_ += size;

  if (realtime_ && sample_rate_ > 0) {
    auto due = started_at_ + std::chrono::microseconds(bytes_since_start_ * 1000000ULL / (sample_rate_ * 2ULL));
    lk.unlock();
    std::this_thread::sleep_until(due);
  }
  return out;
}

void WavFileSource::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  stopped_ = true;
  if (in_.is_open()) in_.close();
}

// ---------- sink ----------

WavFileSink::WavFileSink(const std::string& path, int sample_rate)
: out_(path, std::ios::binary | std::ios::trunc), sample_rate_(sample_rate) {
  if (!out_) throw std::runtime_error("cannot open WAV file for writing: " + path);
  patchHeader();
}

WavFileSink::~WavFileSink() { close(); }

void WavFileSink::patchHeader() {
  const int16_t num_channels = 1;
  const int16_t bits_per_sample = 16;

  out_.seekp(0, std::ios::beg);
  // "RIFF" chunk descriptor
  out_.write("RIFF", 4);
  write_le(out_, uint32_t(36 + data_bytes_));
  out_.write("WAVE", 4);
  // "fmt " sub-chunk
  out_.write("fmt ", 4);
  write_le(out_, uint32_t(16));  // Subchunk1Size for PCM
  write_le(out_, uint16_t(1));   // AudioFormat (1 for PCM)
  write_le(out_, uint16_t(num_channels));
  write_le(out_, uint32_t(sample_rate_));
  write_le(out_, uint32_t(sample_rate_ * num_channels * bits_per_sample / 8)); // ByteRate
  write_le(out_, uint16_t(num_channels * bits_per_sample / 8));               // BlockAlign
  write_le(out_, uint16_t(bits_per_sample));
  // "data" sub-chunk
  out_.write("data", 4);
  write_le(out_, uint32_t(data_bytes_));
  out_.seekp(0, std::ios::end);
}

void WavFileSink::write(const AudioBytes& data) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!out_.is_open()) throw std::runtime_error("WAV sink is closed");
  out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out_) throw std::runtime_error("failed to write WAV data");
  data_bytes_ += static_cast<uint32_t>(data.size());
}

void WavFileSink::flush() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!out_.is_open()) return;
  patchHeader();
  out_.flush();
}

void WavFileSink::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!out_.is_open()) return;
  patchHeader();
  out_.close();
}

} // namespace voxturn
