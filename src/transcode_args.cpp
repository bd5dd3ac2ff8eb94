#include "transcode_args.hpp"

#include <sstream>

#include "base64.hpp"

namespace transcode {

namespace {
constexpr int kAudioPacketSize = 188;

std::string kbps(int value) { return std::to_string(value) + "k"; }

void append(ArgList &out, const ArgList &more) {
  out.insert(out.end(), more.begin(), more.end());
}

void append_srtp_output(ArgList &out, int32_t ssrc, CryptoSuite suite,
                        const std::vector<uint8_t> &srtp,
                        const std::string &address, int port,
                        int packet_size) {
  append(out, {"-ssrc", std::to_string(ssrc), "-f", "rtp", "-srtp_out_suite",
               crypto_suite_name(suite), "-srtp_out_params",
               base64_encode(srtp), srtp_url(address, port, packet_size)});
}
} // namespace

ArgList split_whitespace(const std::string &s) {
  ArgList out;
  std::istringstream ss(s);
  std::string token;
  while (ss >> token)
    out.push_back(token);
  return out;
}

std::string join_args(const ArgList &args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += args[i];
  }
  return out;
}

std::string srtp_url(const std::string &address, int port, int packet_size) {
  const std::string host =
      address.find(':') != std::string::npos ? "[" + address + "]" : address;
  const std::string p = std::to_string(port);
  return "srtp://" + host + ":" + p + "?rtcpport=" + p +
         "&localrtcpport=" + p + "&pkt_size=" + std::to_string(packet_size);
}

ArgList build_stream_args(const VideoConfig &cfg, const ResolutionInfo &res,
                          const Bitrates &bitrates, const SessionInfo &session,
                          const StreamParams &params) {
  ArgList args = split_whitespace(cfg.source);

  append(args, {"-map", cfg.map_video, "-vcodec", cfg.vcodec, "-pix_fmt",
                "yuv420p", "-r", std::to_string(params.fps), "-f",
                "rawvideo"});
  append(args, split_whitespace(cfg.additional_commandline));
  if (cfg.vcodec != "copy" && !res.video_filter.empty())
    append(args, {"-vf", res.video_filter});
  append(args, {"-b:v", kbps(bitrates.video_kbps), "-bufsize",
                kbps(2 * bitrates.video_kbps), "-maxrate",
                kbps(bitrates.video_kbps), "-payload_type",
                std::to_string(params.video_pt)});
  append_srtp_output(args, session.video_ssrc, session.video_crypto_suite,
                     session.video_srtp, session.address, session.video_port,
                     cfg.packet_size);

  if (cfg.audio) {
    append(args, {"-map", cfg.map_audio, "-acodec", "libfdk_aac",
                  "-profile:a", "aac_eld", "-flags", "+global_header", "-f",
                  "null", "-ar", kbps(params.sample_rate), "-b:a",
                  kbps(bitrates.audio_kbps), "-bufsize",
                  kbps(bitrates.audio_kbps), "-ac", "1", "-payload_type",
                  std::to_string(params.audio_pt)});
    append_srtp_output(args, session.audio_ssrc, session.audio_crypto_suite,
                       session.audio_srtp, session.address, session.audio_port,
                       kAudioPacketSize);
  }

  if (cfg.debug)
    append(args, {"-loglevel", "level+verbose"});
  return args;
}

ArgList build_snapshot_args(const VideoConfig &cfg,
                            const ResolutionInfo &res) {
  ArgList args = split_whitespace(
      cfg.still_source.empty() ? cfg.source : cfg.still_source);
  append(args, {"-frames:v", "1"});
  if (!res.video_filter.empty())
    append(args, {"-vf", res.video_filter});
  append(args, {"-f", "image2", "-"});
  return args;
}

} // namespace transcode
