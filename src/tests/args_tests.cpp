#include <algorithm>
#include <string>

#include "base64.hpp"
#include "test_support.hpp"
#include "transcode_args.hpp"

using namespace transcode;

namespace {
// Index of the first occurrence of token, or -1.
long index_of(const ArgList &args, const std::string &token) {
  auto it = std::find(args.begin(), args.end(), token);
  return it == args.end() ? -1 : static_cast<long>(it - args.begin());
}

// Value following flag, or "".
std::string value_of(const ArgList &args, const std::string &flag) {
  const long i = index_of(args, flag);
  if (i < 0 || static_cast<size_t>(i + 1) >= args.size())
    return "";
  return args[i + 1];
}

SessionInfo make_session() {
  SessionInfo s;
  s.address = "192.168.1.20";
  s.video_port = 51000;
  s.video_return_port = 40000;
  s.video_srtp = std::vector<uint8_t>(30, 0x11);
  s.video_ssrc = 12345;
  s.audio_port = 51002;
  s.audio_return_port = 40002;
  s.audio_srtp = std::vector<uint8_t>(30, 0x22);
  s.audio_ssrc = -777;
  return s;
}

VideoConfig make_config() {
  VideoConfig cfg;
  cfg.source = "-re -i rtsp://cam/stream";
  return cfg;
}

void test_srtp_url() {
  log_test("SRTP URL for IPv4",
           srtp_url("10.0.0.5", 5000, 1316) ==
               "srtp://10.0.0.5:5000?rtcpport=5000&localrtcpport=5000&pkt_size=1316",
           srtp_url("10.0.0.5", 5000, 1316));
  log_test("SRTP URL brackets IPv6",
           srtp_url("fe80::1", 5000, 188) ==
               "srtp://[fe80::1]:5000?rtcpport=5000&localrtcpport=5000&pkt_size=188",
           srtp_url("fe80::1", 5000, 188));
}

void test_stream_args() {
  VideoConfig cfg = make_config();
  ResolutionInfo res{1280, 720, "scale=1280:720"};
  Bitrates bitrates{299, 24};
  StreamParams params;
  params.fps = 10;
  const SessionInfo s = make_session();

  const ArgList args = build_stream_args(cfg, res, bitrates, s, params);
  log_test("Stream args start with source tokens",
           args.size() > 3 && args[0] == "-re" && args[1] == "-i" &&
               args[2] == "rtsp://cam/stream");
  log_test("Video map and codec", value_of(args, "-map") == "0:0" &&
                                      value_of(args, "-vcodec") == "libx264");
  log_test("Frame rate", value_of(args, "-r") == "10");
  log_test("Extra args follow rawvideo",
           index_of(args, "rawvideo") < index_of(args, "-preset") &&
               value_of(args, "-tune") == "zerolatency");
  log_test("Filter after extra args",
           index_of(args, "-vf") > index_of(args, "zerolatency") &&
               value_of(args, "-vf") == "scale=1280:720");
  log_test("Bitrate block", value_of(args, "-b:v") == "299k" &&
                                value_of(args, "-bufsize") == "598k" &&
                                value_of(args, "-maxrate") == "299k");
  log_test("Video payload type and SSRC",
           value_of(args, "-payload_type") == "99" &&
               value_of(args, "-ssrc") == "12345");
  log_test("SRTP suite and params",
           value_of(args, "-srtp_out_suite") == "AES_CM_128_HMAC_SHA1_80" &&
               value_of(args, "-srtp_out_params") ==
                   base64_encode(s.video_srtp));
  log_test("Output URL is last without audio",
           args.back() == srtp_url("192.168.1.20", 51000, 1316), args.back());
  log_test("No audio output when audio disabled",
           index_of(args, "-acodec") < 0);
  log_test("No loglevel without debug", index_of(args, "-loglevel") < 0);
}

void test_stream_args_audio_debug() {
  VideoConfig cfg = make_config();
  cfg.audio = true;
  cfg.debug = true;
  ResolutionInfo res{640, 480, ""};
  Bitrates bitrates{500, 24};
  StreamParams params;
  params.fps = 10;
  params.audio_pt = 110;
  params.sample_rate = 16;
  const SessionInfo s = make_session();

  const ArgList args = build_stream_args(cfg, res, bitrates, s, params);
  log_test("Empty filter omits -vf", index_of(args, "-vf") < 0);

  const long acodec = index_of(args, "-acodec");
  log_test("Audio segment after video output",
           acodec > index_of(args, srtp_url("192.168.1.20", 51000, 1316)));
  if (acodec < 0)
    return;
  const ArgList audio(args.begin() + acodec - 2, args.end());
  log_test("Audio map", audio[0] == "-map" && audio[1] == "0:1");
  log_test("Audio codec and rate",
           value_of(audio, "-acodec") == "libfdk_aac" &&
               value_of(audio, "-profile:a") == "aac_eld" &&
               value_of(audio, "-ar") == "16k" &&
               value_of(audio, "-b:a") == "24k" &&
               value_of(audio, "-ac") == "1");
  log_test("Audio payload type and SSRC",
           value_of(audio, "-payload_type") == "110" &&
               value_of(audio, "-ssrc") == "-777");
  log_test("Audio uses 188 byte packets",
           index_of(audio, srtp_url("192.168.1.20", 51002, 188)) >= 0);
  log_test("Debug loglevel last",
           args.size() >= 2 && args[args.size() - 2] == "-loglevel" &&
               args.back() == "level+verbose");
}

void test_copy_codec() {
  VideoConfig cfg = make_config();
  cfg.vcodec = "copy";
  ResolutionInfo res{640, 480, "scale=640:480"};
  StreamParams params;
  params.fps = 10;
  const ArgList args =
      build_stream_args(cfg, res, Bitrates{300, 0}, make_session(), params);
  log_test("Copy codec never gets a filter", index_of(args, "-vf") < 0);
}

void test_snapshot_args() {
  VideoConfig cfg = make_config();
  ResolutionInfo res{640, 360, "scale=640:360"};
  ArgList args = build_snapshot_args(cfg, res);
  log_test("Snapshot uses stream source when no still source",
           args[0] == "-re" && args[2] == "rtsp://cam/stream");
  log_test("Snapshot grabs one frame to stdout",
           value_of(args, "-frames:v") == "1" && args.back() == "-" &&
               value_of(args, "-f") == "image2" &&
               value_of(args, "-vf") == "scale=640:360");

  cfg.still_source = "-i http://cam/still.jpg";
  args = build_snapshot_args(cfg, res);
  log_test("Snapshot prefers still source", args[1] == "http://cam/still.jpg");
}

void test_split_join() {
  const ArgList t = split_whitespace("  -re   -i\trtsp://x  ");
  log_test("Whitespace split drops empty tokens",
           t.size() == 3 && t[2] == "rtsp://x");
  log_test("Join uses single spaces", join_args(t) == "-re -i rtsp://x");
}
} // namespace

void test_transcode_args() {
  section("Transcoder arguments");
  test_srtp_url();
  test_stream_args();
  test_stream_args_audio_debug();
  test_copy_codec();
  test_snapshot_args();
  test_split_join();
}
