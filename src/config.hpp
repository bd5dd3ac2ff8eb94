#pragma once

#include <string>

#include "types.hpp"

struct AppConfig {
  std::string addr = "0.0.0.0";
  int port = 8080;
  std::string name = "Camera";
  VideoConfig video;
  std::string processor = "ffmpeg";
  std::string interface_name; // empty = default route interface
  int ready_timeout_ms = 15000;
  int kill_grace_ms = 2000;
  bool show_help = false;
};

// Throws ConfigurationError on unknown flags or malformed values. Does not
// validate the camera; see validate_video_config.
AppConfig parse_config(int argc, char *argv[]);

// Throws ConfigurationError (missing source, bad caps, min > max bitrate).
void validate_video_config(const VideoConfig &cfg);

// "W", "H" or "" (case-insensitive); throws ConfigurationError otherwise.
AspectMode parse_aspect_mode(const std::string &value);

std::string usage();
