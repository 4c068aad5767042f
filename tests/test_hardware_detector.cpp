// Component: hardware encoder detection

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "video_split/hardware_detector.hpp"

namespace video_split {
namespace {

namespace fs = std::filesystem;

constexpr const char *kEncodersOutput =
    "Encoders:\n"
    " V..... = Video\n"
    " A..... = Audio\n"
    " ------\n"
    " V....D libx264              libx264 H.264 / AVC (codec h264)\n"
    " V....D h264_videotoolbox    VideoToolbox H.264 Encoder (codec h264)\n"
    " V....D hevc_videotoolbox    VideoToolbox H.265 Encoder (codec hevc)\n"
    " A....D aac                  AAC (Advanced Audio Coding)\n";

// -----------------------------------------------------------------------------
// Encoder list parsing
// -----------------------------------------------------------------------------
TEST(EncoderListedTest, FindsEncoderByName) {
  EXPECT_TRUE(encoder_listed(kEncodersOutput, "h264_videotoolbox"));
  EXPECT_TRUE(encoder_listed(kEncodersOutput, "libx264"));
  EXPECT_TRUE(encoder_listed(kEncodersOutput, "aac"));
}

TEST(EncoderListedTest, IgnoresPartialAndDescriptionMatches) {
  EXPECT_FALSE(encoder_listed(kEncodersOutput, "h264_nvenc"));
  EXPECT_FALSE(encoder_listed(kEncodersOutput, "videotoolbox"));
  EXPECT_FALSE(encoder_listed(kEncodersOutput, "VideoToolbox"));
  EXPECT_FALSE(encoder_listed(kEncodersOutput, "h264"));
  EXPECT_FALSE(encoder_listed(kEncodersOutput, "Video"));
}

TEST(EncoderListedTest, EmptyInputs) {
  EXPECT_FALSE(encoder_listed("", "libx264"));
  EXPECT_FALSE(encoder_listed(kEncodersOutput, ""));
}

// -----------------------------------------------------------------------------
// Detector against stand-in executables
// -----------------------------------------------------------------------------
class HardwareDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("video_split_hw_" + std::to_string(::getpid()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  /// Write an executable script standing in for ffmpeg
  std::string WriteScript(const std::string &name, const std::string &body) {
    fs::path path = dir_ / name;
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
    out.close();
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    return path.string();
  }

  fs::path dir_;
};

TEST_F(HardwareDetectorTest, AvailableWhenListed) {
  std::string bin = WriteScript(
      "ffmpeg_hw", std::string("cat <<'LIST'\n") + kEncodersOutput + "LIST");
  HardwareCapabilityDetector detector(bin, "h264_videotoolbox");
  EXPECT_TRUE(detector.available());
  EXPECT_EQ(detector.encoder(), "h264_videotoolbox");
}

TEST_F(HardwareDetectorTest, UnavailableWhenNotListed) {
  std::string bin = WriteScript(
      "ffmpeg_sw", std::string("cat <<'LIST'\n") + kEncodersOutput + "LIST");
  HardwareCapabilityDetector detector(bin, "h264_nvenc");
  EXPECT_FALSE(detector.available());
}

TEST_F(HardwareDetectorTest, FailingQueryMeansUnavailable) {
  std::string bin = WriteScript(
      "ffmpeg_broken", std::string("cat <<'LIST'\n") + kEncodersOutput +
                           "LIST\nexit 1");
  HardwareCapabilityDetector detector(bin, "h264_videotoolbox");
  EXPECT_FALSE(detector.available());
}

TEST_F(HardwareDetectorTest, AnswerIsCached) {
  fs::path marker = dir_ / "calls";
  std::string bin = WriteScript(
      "ffmpeg_count", "echo x >> '" + marker.string() + "'\n" +
                          "echo ' V....D h264_videotoolbox  VT'");
  HardwareCapabilityDetector detector(bin, "h264_videotoolbox");
  EXPECT_TRUE(detector.available());
  EXPECT_TRUE(detector.available());

  std::ifstream in(marker);
  std::string line;
  int calls = 0;
  while (std::getline(in, line))
    ++calls;
  EXPECT_EQ(calls, 1);
}

TEST(HardwareDetectorStandaloneTest, MissingExecutableMeansUnavailable) {
  HardwareCapabilityDetector detector("video-split-no-such-ffmpeg",
                                      "h264_videotoolbox");
  EXPECT_FALSE(detector.available());
}

TEST(HardwareDetectorStandaloneTest, ForceSoftwareSkipsProbe) {
  /// The binary would not even run; forcing software never launches it
  HardwareCapabilityDetector detector("video-split-no-such-ffmpeg",
                                      "h264_videotoolbox", true);
  EXPECT_FALSE(detector.available());
}

} // namespace
} // namespace video_split
