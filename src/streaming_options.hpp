#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct ResolutionOption {
  int width;
  int height;
  int fps;
};

// What the camera advertises to controllers.
struct StreamingOptions {
  int stream_count = 2;
  std::vector<CryptoSuite> crypto_suites;
  std::vector<ResolutionOption> resolutions;
  std::vector<std::string> h264_profiles;
  std::vector<std::string> h264_levels;
  std::string audio_codec;
  int audio_sample_rate = 16; // kHz
};

StreamingOptions make_streaming_options(const VideoConfig &cfg);
