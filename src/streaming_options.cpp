#include "streaming_options.hpp"

StreamingOptions make_streaming_options(const VideoConfig &cfg) {
  StreamingOptions o;
  o.stream_count = cfg.max_streams;
  o.crypto_suites = {CryptoSuite::AES_CM_128_HMAC_SHA1_80};
  o.resolutions = {
      {320, 180, 30},  {320, 240, 15}, // Apple Watch requires 320x240@15
      {320, 240, 30},  {480, 270, 30},  {480, 360, 30},   {640, 360, 30},
      {640, 480, 30},  {1280, 720, 30}, {1280, 960, 30},  {1920, 1080, 30},
      {1600, 1200, 30}};
  o.h264_profiles = {"baseline", "main", "high"};
  o.h264_levels = {"3.1", "3.2", "4.0"};
  o.audio_codec = "AAC-ELD";
  o.audio_sample_rate = 16;
  return o;
}
