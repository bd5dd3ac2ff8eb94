#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class AspectMode {
  None,
  LockWidth,  // "W": width fixed, height follows
  LockHeight  // "H": height fixed, width follows
};

enum class AddressFamily { V4, V6 };

// Wire ids as sent by the controller.
enum class CryptoSuite : int {
  AES_CM_128_HMAC_SHA1_80 = 0,
  AES_256_CM_HMAC_SHA1_80 = 1,
  NONE = 2,
  UNKNOWN = -1
};

// Per-camera settings. Immutable once the camera is constructed.
struct VideoConfig {
  std::string source;       // e.g. "-re -i rtsp://cam/stream"
  std::string still_source; // optional, falls back to source
  int max_width = 1280;
  int max_height = 720;
  int max_fps = 10;
  int max_bitrate = 0; // kbps, 0 = unset
  int min_bitrate = 0; // kbps, 0 = unset
  int max_streams = 2;
  int packet_size = 1316;
  std::string vcodec = "libx264";
  // Empty means "synthesize scale from aspect mode", "none" disables filtering.
  std::string video_filter;
  bool hflip = false;
  bool vflip = false;
  AspectMode preserve_ratio = AspectMode::None;
  std::string map_video = "0:0";
  std::string map_audio = "0:1";
  std::string additional_commandline = "-preset ultrafast -tune zerolatency";
  bool audio = false;
  bool debug = false;
};

struct ResolutionInfo {
  int width = 0;
  int height = 0;
  std::string video_filter; // comma joined, empty = no -vf
};

struct Bitrates {
  int video_kbps = 0;
  int audio_kbps = 0;
};

struct SessionInfo {
  std::string address; // remote endpoint
  AddressFamily family = AddressFamily::V4;

  int video_port = 0;
  int video_return_port = 0;
  CryptoSuite video_crypto_suite = CryptoSuite::AES_CM_128_HMAC_SHA1_80;
  std::vector<uint8_t> video_srtp; // key + salt
  int32_t video_ssrc = 0;

  int audio_port = 0;
  int audio_return_port = 0;
  CryptoSuite audio_crypto_suite = CryptoSuite::AES_CM_128_HMAC_SHA1_80;
  std::vector<uint8_t> audio_srtp;
  int32_t audio_ssrc = 0;
};

struct MediaSetup {
  int port = 0;
  CryptoSuite crypto_suite = CryptoSuite::AES_CM_128_HMAC_SHA1_80;
  std::vector<uint8_t> srtp_key;
  std::vector<uint8_t> srtp_salt;
};

struct PrepareRequest {
  std::string session_id;
  std::string target_address;
  AddressFamily family = AddressFamily::V4;
  MediaSetup video;
  MediaSetup audio;
};

struct MediaReturn {
  int port = 0;
  int32_t ssrc = 0;
  std::vector<uint8_t> srtp_key;
  std::vector<uint8_t> srtp_salt;
};

struct PrepareResponse {
  std::string address;
  MediaReturn video;
  MediaReturn audio;
};

struct VideoRequest {
  int width = 0;
  int height = 0;
  int fps = 0;
  int max_bit_rate = 0; // kbps
  int pt = 99;
};

struct AudioRequest {
  int sample_rate = 16; // kHz
  int max_bit_rate = 0; // kbps
  int pt = 110;
};

struct StartRequest {
  std::string session_id;
  VideoRequest video;
  AudioRequest audio;
};

const char *crypto_suite_name(CryptoSuite suite);
CryptoSuite crypto_suite_from_id(int id);
// True when the transcoder can emit SRTP with this suite.
bool crypto_suite_supported(CryptoSuite suite);
const char *address_family_label(AddressFamily family);
