/**
 * @file metadata_probe.cpp
 * @brief Video metadata extraction implementation
 */

#include "video_split/metadata_probe.hpp"

#include <cstdlib>
#include <utility>

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/rational.h>
}

#include <fmt/core.h>

#include "video_split/config.hpp"
#include "video_split/logging.hpp"

namespace video_split {

namespace {

/// av_err2str is a compound-literal macro that C++ cannot use
std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

/// Parse a decimal tag value; 0 if absent or malformed
int64_t parse_tag_int(const AVDictionary *dict, const char *key) {
  const AVDictionaryEntry *e = av_dict_get(dict, key, nullptr, 0);
  if (!e || !e->value)
    return 0;
  char *end = nullptr;
  long long v = std::strtoll(e->value, &end, 10);
  return (end != e->value && v > 0) ? static_cast<int64_t>(v) : 0;
}

} // anonymous namespace

MetadataProbe::MetadataProbe(std::string path) : path_(std::move(path)) {}

MetadataProbe::~MetadataProbe() {
  /// avformat_close_input also frees a context that was only allocated
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MetadataProbe::initialize(std::string &error) {
  int ret = avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    /// On failure fmt_ctx is freed and set to NULL by libavformat
    error = fmt::format("cannot open '{}': {}", path_, av_error_string(ret));
    return false;
  }

  /// Reads some packets to fill in codec parameters and frame rates
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    error = fmt::format("cannot read stream info of '{}': {}", path_,
                        av_error_string(ret));
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    error = fmt::format("no video stream found in '{}'", path_);
    return false;
  }

  return true;
}

double MetadataProbe::get_duration() const {
  return (fmt_ctx->duration != AV_NOPTS_VALUE)
             ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

double MetadataProbe::get_fps() const {
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  AVRational r = st->avg_frame_rate;
  if (r.num > 0 && r.den > 0)
    return av_q2d(r);
  r = st->r_frame_rate;
  if (r.num > 0 && r.den > 0)
    return av_q2d(r);
  return FALLBACK_FRAME_RATE;
}

int64_t MetadataProbe::get_bit_rate(BitRateFallback fallback,
                                    bool &used_default) const {
  used_default = false;
  const AVStream *st = fmt_ctx->streams[video_stream_idx];

  if (st->codecpar->bit_rate > 0)
    return st->codecpar->bit_rate;

  /// Matroska muxers store per-stream statistics as tags
  int64_t bps = parse_tag_int(st->metadata, "BPS");
  if (bps == 0)
    bps = parse_tag_int(st->metadata, "BPS-eng");
  if (bps > 0)
    return bps;

  if (fallback == BitRateFallback::StreamOnly)
    return 0;

  if (fmt_ctx->bit_rate > 0)
    return fmt_ctx->bit_rate;

  used_default = true;
  return Config::default_bit_rate();
}

int MetadataProbe::get_width() const {
  return fmt_ctx->streams[video_stream_idx]->codecpar->width;
}

int MetadataProbe::get_height() const {
  return fmt_ctx->streams[video_stream_idx]->codecpar->height;
}

bool probe_video(const std::string &path, BitRateFallback fallback,
                 VideoMetadata &out, Error &error) {
  MetadataProbe probe(path);
  std::string reason;
  if (!probe.initialize(reason)) {
    error.code = ErrorCode::ProbeError;
    error.message = reason;
    return false;
  }

  bool used_default = false;
  out.frame_rate = probe.get_fps();
  out.bit_rate = probe.get_bit_rate(fallback, used_default);
  out.width = probe.get_width();
  out.height = probe.get_height();
  out.duration_seconds = probe.get_duration();

  if (used_default) {
    LOG_WARN("Could not determine bit rate of '{}', using default: {:.2f} Mbps",
             path, out.bit_rate / 1000000.0);
  }
  return true;
}

} // namespace video_split
