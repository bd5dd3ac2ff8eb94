#include "negotiator.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace negotiate {

namespace {
std::string scale_directive(int width, int height, AspectMode mode) {
  switch (mode) {
  case AspectMode::LockWidth:
    return std::to_string(width) + ":-1";
  case AspectMode::LockHeight:
    return "-1:" + std::to_string(height);
  default:
    return std::to_string(width) + ":" + std::to_string(height);
  }
}

std::string join(const std::vector<std::string> &parts, char sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += sep;
    out += parts[i];
  }
  return out;
}
} // namespace

ResolutionInfo determine_resolution(int width, int height,
                                    const VideoConfig &cfg) {
  ResolutionInfo res;
  res.width = std::min(width, cfg.max_width);
  res.height = std::min(height, cfg.max_height);

  if (cfg.video_filter == "none")
    return res;

  const std::string filter =
      cfg.video_filter.empty()
          ? "scale=" + scale_directive(res.width, res.height,
                                       cfg.preserve_ratio)
          : cfg.video_filter;

  std::vector<std::string> vf;
  if (cfg.hflip)
    vf.push_back("hflip");
  if (cfg.vflip)
    vf.push_back("vflip");
  vf.push_back(filter);
  res.video_filter = join(vf, ',');
  return res;
}

int clamp_fps(int fps, const VideoConfig &cfg) {
  return std::min(fps, cfg.max_fps);
}

Bitrates clamp_bitrates(int video_kbps, int audio_kbps,
                        const VideoConfig &cfg) {
  Bitrates out{video_kbps, audio_kbps};
  if (cfg.max_bitrate > 0 && out.video_kbps > cfg.max_bitrate) {
    out.video_kbps = cfg.max_bitrate;
  } else if (cfg.min_bitrate > 0 && out.video_kbps < cfg.min_bitrate) {
    out.video_kbps = cfg.min_bitrate;
  }
  if (cfg.max_bitrate > 0 && out.audio_kbps > cfg.max_bitrate)
    out.audio_kbps = cfg.max_bitrate;
  return out;
}

} // namespace negotiate
