#include "config.hpp"

#include <stdexcept>

#include "errors.hpp"

namespace {
int to_int(const std::string &flag, const std::string &value) {
  try {
    size_t used = 0;
    const int v = std::stoi(value, &used);
    if (used != value.size())
      throw std::invalid_argument(value);
    return v;
  } catch (const std::logic_error &) {
    throw ConfigurationError("Invalid value for " + flag + ": \"" + value +
                             "\"");
  }
}
} // namespace

AspectMode parse_aspect_mode(const std::string &value) {
  if (value.empty())
    return AspectMode::None;
  if (value == "W" || value == "w")
    return AspectMode::LockWidth;
  if (value == "H" || value == "h")
    return AspectMode::LockHeight;
  throw ConfigurationError("Invalid preserve-ratio \"" + value +
                           "\" (expected W or H)");
}

AppConfig parse_config(int argc, char *argv[]) {
  AppConfig cfg;
  VideoConfig &v = cfg.video;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    auto next = [&]() -> std::string {
      if (i + 1 >= argc)
        throw ConfigurationError("Missing value for " + arg);
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
    } else if (arg == "--addr") {
      cfg.addr = next();
    } else if (arg == "--port") {
      cfg.port = to_int(arg, next());
    } else if (arg == "--name") {
      cfg.name = next();
    } else if (arg == "--processor") {
      cfg.processor = next();
    } else if (arg == "--interface") {
      cfg.interface_name = next();
    } else if (arg == "--ready-timeout") {
      cfg.ready_timeout_ms = to_int(arg, next()) * 1000;
    } else if (arg == "--kill-grace") {
      cfg.kill_grace_ms = to_int(arg, next()) * 1000;
    } else if (arg == "--source") {
      v.source = next();
    } else if (arg == "--still-source") {
      v.still_source = next();
    } else if (arg == "--max-width") {
      v.max_width = to_int(arg, next());
    } else if (arg == "--max-height") {
      v.max_height = to_int(arg, next());
    } else if (arg == "--max-fps") {
      v.max_fps = to_int(arg, next());
    } else if (arg == "--max-bitrate") {
      v.max_bitrate = to_int(arg, next());
    } else if (arg == "--min-bitrate") {
      v.min_bitrate = to_int(arg, next());
    } else if (arg == "--max-streams") {
      v.max_streams = to_int(arg, next());
    } else if (arg == "--packet-size") {
      v.packet_size = to_int(arg, next());
    } else if (arg == "--vcodec") {
      v.vcodec = next();
    } else if (arg == "--video-filter") {
      v.video_filter = next();
    } else if (arg == "--hflip") {
      v.hflip = true;
    } else if (arg == "--vflip") {
      v.vflip = true;
    } else if (arg == "--preserve-ratio") {
      v.preserve_ratio = parse_aspect_mode(next());
    } else if (arg == "--map-video") {
      v.map_video = next();
    } else if (arg == "--map-audio") {
      v.map_audio = next();
    } else if (arg == "--extra-args") {
      v.additional_commandline = next();
    } else if (arg == "--audio") {
      v.audio = true;
    } else if (arg == "--debug") {
      v.debug = true;
    } else {
      throw ConfigurationError("Unknown option " + arg);
    }
  }

  if (cfg.port <= 0 || cfg.port > 65535)
    throw ConfigurationError("Invalid --port " + std::to_string(cfg.port));
  if (cfg.ready_timeout_ms < 0 || cfg.kill_grace_ms < 0)
    throw ConfigurationError("Timeouts must not be negative");
  return cfg;
}

void validate_video_config(const VideoConfig &cfg) {
  if (cfg.source.empty())
    throw ConfigurationError("Missing source for camera.");
  if (cfg.max_width <= 0 || cfg.max_height <= 0 || cfg.max_fps <= 0)
    throw ConfigurationError("maxWidth, maxHeight and maxFPS must be positive.");
  if (cfg.max_bitrate < 0 || cfg.min_bitrate < 0)
    throw ConfigurationError("Bitrate limits must not be negative.");
  if (cfg.max_bitrate > 0 && cfg.min_bitrate > cfg.max_bitrate)
    throw ConfigurationError("minBitrate is greater than maxBitrate.");
  if (cfg.max_streams <= 0)
    throw ConfigurationError("maxStreams must be at least 1.");
  if (cfg.packet_size <= 0)
    throw ConfigurationError("packetSize must be positive.");
  if (cfg.vcodec.empty() || cfg.map_video.empty())
    throw ConfigurationError("vcodec and mapvideo must not be empty.");
}

std::string usage() {
  return "CamBridge\n"
         "  --addr <ip>              Bind address (default 0.0.0.0)\n"
         "  --port <port>            Bind port (default 8080)\n"
         "  --name <name>            Camera name used in logs (default Camera)\n"
         "  --source <args>          Transcoder input, e.g. \"-re -i rtsp://...\"\n"
         "  --still-source <args>    Input for snapshots (default: --source)\n"
         "  --max-width <px>         Width cap (default 1280)\n"
         "  --max-height <px>        Height cap (default 720)\n"
         "  --max-fps <fps>          Frame rate cap (default 10)\n"
         "  --max-bitrate <kbps>     Bitrate cap (default unset)\n"
         "  --min-bitrate <kbps>     Video bitrate floor (default unset)\n"
         "  --max-streams <n>        Concurrent streams (default 2)\n"
         "  --packet-size <bytes>    Video RTP packet size (default 1316)\n"
         "  --vcodec <codec>         Video encoder (default libx264)\n"
         "  --video-filter <vf>      Custom filter, \"none\" disables scaling\n"
         "  --hflip / --vflip        Mirror the image\n"
         "  --preserve-ratio <W|H>   Keep aspect ratio locked to width/height\n"
         "  --map-video <map>        Video stream map (default 0:0)\n"
         "  --map-audio <map>        Audio stream map (default 0:1)\n"
         "  --extra-args <args>      Extra encoder flags "
         "(default \"-preset ultrafast -tune zerolatency\")\n"
         "  --audio                  Enable audio\n"
         "  --debug                  Verbose logging\n"
         "  --processor <path>       Transcoder binary (default ffmpeg)\n"
         "  --interface <name>       Interface whose address is advertised\n"
         "  --ready-timeout <s>      Stream start timeout, 0 = none (default 15)\n"
         "  --kill-grace <s>         SIGINT to SIGKILL delay (default 2)\n";
}
