#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "audio/wav_file.hpp"

using namespace voxturn;

namespace {

std::string tempPath(const std::string& name) {
  return ::testing::TempDir() + "voxturn_" + name;
}

TEST(WavFile, SinkOutputReadsBackThenPadsSilence) {
  const std::string path = tempPath("roundtrip.wav");
  {
    WavFileSink sink(path, 16000);
    sink.write(AudioBytes{1, 2, 3, 4});
    sink.write(AudioBytes{5, 6});
    EXPECT_EQ(sink.dataBytes(), 6u);
  }

  std::ifstream raw(path, std::ios::binary | std::ios::ate);
  EXPECT_EQ(static_cast<long>(raw.tellg()), 44 + 6);

  WavFileSource source(path, 16000, false);
  EXPECT_EQ(source.sampleRate(), 16000);
  EXPECT_EQ(source.dataBytes(), 6u);
  source.start();
  EXPECT_EQ(source.read(4), (AudioBytes{1, 2, 3, 4}));
  EXPECT_EQ(source.read(4), (AudioBytes{5, 6, 0, 0}));
  EXPECT_EQ(source.read(4), (AudioBytes{0, 0, 0, 0}));

  source.stop();
  EXPECT_TRUE(source.read(4).empty());
  std::remove(path.c_str());
}

TEST(WavFile, SampleRateMismatchRejected) {
  const std::string path = tempPath("rate.wav");
  { WavFileSink sink(path, 24000); }
  EXPECT_THROW(WavFileSource(path, 16000, false), std::runtime_error);
  EXPECT_NO_THROW(WavFileSource(path, 24000, false));
  std::remove(path.c_str());
}

TEST(WavFile, NonWaveInputRejected) {
  const std::string path = tempPath("garbage.wav");
  {
    std::ofstream out(path, std::ios::binary);
    out << "definitely not audio";
  }
  EXPECT_THROW(WavFileSource(path, 16000, false), std::runtime_error);
  std::remove(path.c_str());
}

TEST(WavFile, MissingFileRejected) {
  EXPECT_THROW(WavFileSource(tempPath("does_not_exist.wav"), 16000, false), std::runtime_error);
}

TEST(WavFile, WriteAfterCloseThrows) {
  const std::string path = tempPath("closed.wav");
  WavFileSink sink(path, 16000);
  sink.close();
  EXPECT_THROW(sink.write(AudioBytes{1, 2}), std::runtime_error);
  std::remove(path.c_str());
}

TEST(WavFile, RealtimeReadsArePaced) {
  const std::string path = tempPath("paced.wav");
  { WavFileSink sink(path, 16000); }
  WavFileSource source(path, 16000, true);
  source.start();
  auto begin = std::chrono::steady_clock::now();
  source.read(3200); // 100 ms at 16 kHz
  EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(90));
  std::remove(path.c_str());
}

} // namespace
