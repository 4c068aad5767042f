// Component: ffmpeg argument construction

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "video_split/config.hpp"
#include "video_split/encoder_selector.hpp"
#include "video_split/ffmpeg_executor.hpp"
#include "video_split/segment_planner.hpp"

namespace video_split {
namespace {

using Args = std::vector<std::string>;

/// Value following `flag`, or "" if the flag is absent
std::string ValueOf(const Args &args, const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end())
    return "";
  return *(it + 1);
}

bool Has(const Args &args, const std::string &flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

EncoderPlan MakePlan(RateControlMode mode, bool hw,
                     std::optional<double> fps = std::nullopt) {
  VideoMetadata src;
  src.frame_rate = 29.97;
  src.bit_rate = 8000000;
  src.width = 1280;
  src.height = 720;
  src.duration_seconds = 100.0;

  EncoderPlan plan;
  Error error;
  EXPECT_TRUE(select_encoder_plan(mode, src.bit_rate, hw, fps, src, plan, error));
  return plan;
}

Args Build(const EncoderPlan &plan, SegmentRange range = {2, 60.0, 60.0}) {
  EncodeJob job{"/videos/my video.mp4", "/videos/my video_parts/my video_part002.mp4",
                range, &plan};
  return build_encode_args("ffmpeg", job);
}

// -----------------------------------------------------------------------------
// Common structure
// -----------------------------------------------------------------------------
TEST(FFmpegArgsTest, InputRangeAndOutput) {
  EncoderPlan plan = MakePlan(RateControlMode::VBR, false);
  Args args = Build(plan, {3, 120.0, 0.5});

  EXPECT_EQ(args.front(), "ffmpeg");
  EXPECT_TRUE(Has(args, "-y"));
  EXPECT_EQ(ValueOf(args, "-i"), "/videos/my video.mp4");
  EXPECT_EQ(ValueOf(args, "-ss"), "120");
  EXPECT_EQ(ValueOf(args, "-t"), "0.5");
  EXPECT_EQ(args.back(), "/videos/my video_parts/my video_part002.mp4");
}

TEST(FFmpegArgsTest, AudioIsAlwaysCopied) {
  for (auto mode : {RateControlMode::CBR, RateControlMode::VBR}) {
    for (bool hw : {true, false}) {
      Args args = Build(MakePlan(mode, hw));
      EXPECT_EQ(ValueOf(args, "-c:a"), "copy");
    }
  }
}

TEST(FFmpegArgsTest, ResolutionIsKept) {
  Args args = Build(MakePlan(RateControlMode::CBR, false));
  EXPECT_EQ(ValueOf(args, "-vf"), "scale=1280:720");
}

TEST(FFmpegArgsTest, FrameRateOnlyWhenRequested) {
  EXPECT_FALSE(Has(Build(MakePlan(RateControlMode::VBR, false)), "-r"));
  EXPECT_EQ(ValueOf(Build(MakePlan(RateControlMode::VBR, false, 30.0)), "-r"),
            "30");
  EXPECT_EQ(ValueOf(Build(MakePlan(RateControlMode::VBR, false, 23.976)), "-r"),
            "23.976");
}

TEST(FFmpegArgsTest, TinyRangesUseDecimalNotation) {
  EncoderPlan plan = MakePlan(RateControlMode::VBR, false);

  /// 180.00005 / 60 leaves a 50 us tail segment
  std::vector<SegmentRange> ranges;
  Error error;
  ASSERT_TRUE(plan_segments(180.00005, SplitIntent::by_duration(60.0), ranges,
                            error));
  Args tail = Build(plan, ranges.back());
  EXPECT_EQ(ValueOf(tail, "-ss"), "180");
  EXPECT_EQ(ValueOf(tail, "-t"), "0.00005");

  /// 0.4 ms in 8 parts: 50 us steps
  ASSERT_TRUE(plan_segments(0.0004, SplitIntent::by_count(8), ranges, error));
  Args second = Build(plan, ranges[1]);
  EXPECT_EQ(ValueOf(second, "-ss"), "0.00005");
  EXPECT_EQ(ValueOf(second, "-t"), "0.00005");

  for (const Args &args : {tail, second}) {
    for (const char *flag : {"-ss", "-t"}) {
      EXPECT_EQ(ValueOf(args, flag).find_first_of("eE"), std::string::npos)
          << flag << " " << ValueOf(args, flag);
    }
  }
}

TEST(FormatSecondsTest, FixedNotationWithoutTrailingZeros) {
  EXPECT_EQ(format_seconds(0.0), "0");
  EXPECT_EQ(format_seconds(120.0), "120");
  EXPECT_EQ(format_seconds(0.5), "0.5");
  EXPECT_EQ(format_seconds(5e-05), "0.00005");
  EXPECT_EQ(format_seconds(4.999999998744897e-05), "0.00005");
  EXPECT_EQ(format_seconds(1e-07), "0");
  EXPECT_EQ(format_seconds(3600.123456789), "3600.123457");
}

// -----------------------------------------------------------------------------
// Rate control per mode
// -----------------------------------------------------------------------------
TEST(FFmpegArgsTest, CbrFlags) {
  Args args = Build(MakePlan(RateControlMode::CBR, true));

  EXPECT_EQ(ValueOf(args, "-c:v"), Config::sw_encoder());
  EXPECT_EQ(ValueOf(args, "-b:v"), "8000000");
  EXPECT_EQ(ValueOf(args, "-minrate"), "8000000");
  EXPECT_EQ(ValueOf(args, "-maxrate"), "8000000");
  EXPECT_EQ(ValueOf(args, "-bufsize"), "1000000");
  EXPECT_EQ(ValueOf(args, "-x264-params"), "nal-hrd=cbr:force-cfr=1:bitrate=8000");
  EXPECT_EQ(ValueOf(args, "-preset"), Config::cbr_preset());
}

TEST(FFmpegArgsTest, HardwareVbrFlags) {
  Args args = Build(MakePlan(RateControlMode::VBR, true));

  EXPECT_EQ(ValueOf(args, "-c:v"), Config::hw_encoder());
  EXPECT_EQ(ValueOf(args, "-b:v"), "8000000");
  EXPECT_FALSE(Has(args, "-maxrate"));
  EXPECT_FALSE(Has(args, "-bufsize"));
  EXPECT_FALSE(Has(args, "-x264-params"));
  EXPECT_FALSE(Has(args, "-preset"));
}

TEST(FFmpegArgsTest, SoftwareVbrFlags) {
  Args args = Build(MakePlan(RateControlMode::VBR, false));

  EXPECT_EQ(ValueOf(args, "-c:v"), Config::sw_encoder());
  EXPECT_EQ(ValueOf(args, "-b:v"), "8000000");
  EXPECT_EQ(ValueOf(args, "-bufsize"), "16000000");
  EXPECT_FALSE(Has(args, "-maxrate"));
  EXPECT_FALSE(Has(args, "-x264-params"));
  EXPECT_EQ(ValueOf(args, "-preset"), Config::vbr_preset());
}

// -----------------------------------------------------------------------------
// Backend status reporting
// -----------------------------------------------------------------------------
TEST(FFmpegEncodeBackendTest, ReportsEncoderExitStatus) {
  EncoderPlan plan = MakePlan(RateControlMode::VBR, false);
  EncodeJob job{"in.mp4", "out.mp4", {1, 0.0, 10.0}, &plan};

  /// `true`/`false` stand in for an encoder that ignores its arguments
  FFmpegEncodeBackend ok("true", 10.0, 2048);
  EncodeResult good = ok.encode(job);
  EXPECT_TRUE(good.success);
  EXPECT_EQ(good.status, "exit code 0");
  EXPECT_EQ(good.command_line.rfind("true ", 0), 0u);

  FFmpegEncodeBackend failing("false", 10.0, 2048);
  EncodeResult bad = failing.encode(job);
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.status, "exit code 1");
  EXPECT_NE(bad.command_line.find("out.mp4"), std::string::npos);
}

TEST(FFmpegEncodeBackendTest, MissingEncoderBinaryFails) {
  EncoderPlan plan = MakePlan(RateControlMode::CBR, false);
  EncodeJob job{"in.mp4", "out.mp4", {1, 0.0, 10.0}, &plan};

  FFmpegEncodeBackend backend("video-split-no-such-ffmpeg", 0.0, 2048);
  EncodeResult r = backend.encode(job);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.status, "exit code 127 (could not execute)");
  EXPECT_FALSE(r.diagnostics.empty());
}

} // namespace
} // namespace video_split
