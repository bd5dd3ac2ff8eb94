#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace transcode {

// Negotiated per-start values that do not live in SessionInfo.
struct StreamParams {
  int fps = 0;
  int video_pt = 99;
  int audio_pt = 110;
  int sample_rate = 16; // kHz
};

using ArgList = std::vector<std::string>;

// Full transcoder argv (without argv[0]) for one streaming session.
ArgList build_stream_args(const VideoConfig &cfg, const ResolutionInfo &res,
                          const Bitrates &bitrates, const SessionInfo &session,
                          const StreamParams &params);

// One frame, image2 on stdout.
ArgList build_snapshot_args(const VideoConfig &cfg, const ResolutionInfo &res);

// "srtp://host:port?rtcpport=port&localrtcpport=port&pkt_size=N"
std::string srtp_url(const std::string &address, int port, int packet_size);

ArgList split_whitespace(const std::string &s);
std::string join_args(const ArgList &args);

} // namespace transcode
