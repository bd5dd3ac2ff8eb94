#include "http_api.hpp"

#include <sstream>
#include <stdexcept>

#include "base64.hpp"

namespace http {

namespace {

const std::string kJson = "application/json";

std::string param_or(const httplib::Request &req, const std::string &name,
                     const std::string &fallback) {
  return req.has_param(name) ? req.get_param_value(name) : fallback;
}

std::string required_param(const httplib::Request &req,
                           const std::string &name) {
  if (!req.has_param(name))
    throw BadRequestError("Missing parameter \"" + name + "\".");
  return req.get_param_value(name);
}

int to_int(const std::string &name, const std::string &value) {
  size_t used = 0;
  int out = 0;
  try {
    out = std::stoi(value, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != value.size())
    throw BadRequestError("Parameter \"" + name + "\" must be an integer.");
  return out;
}

int int_param(const httplib::Request &req, const std::string &name) {
  return to_int(name, required_param(req, name));
}

int int_param(const httplib::Request &req, const std::string &name,
              int fallback) {
  return req.has_param(name) ? to_int(name, req.get_param_value(name))
                             : fallback;
}

std::vector<uint8_t> base64_param(const httplib::Request &req,
                                  const std::string &name) {
  auto bytes = base64_decode(required_param(req, name));
  if (!bytes)
    throw BadRequestError("Parameter \"" + name + "\" is not valid base64.");
  return *bytes;
}

MediaSetup parse_media(const httplib::Request &req, const std::string &prefix) {
  MediaSetup m;
  m.port = int_param(req, prefix + "_port");
  if (m.port <= 0 || m.port > 65535)
    throw BadRequestError("Parameter \"" + prefix + "_port\" out of range.");
  m.crypto_suite = crypto_suite_from_id(int_param(req, prefix + "_crypto_suite", 0));
  m.srtp_key = base64_param(req, prefix + "_srtp_key");
  m.srtp_salt = base64_param(req, prefix + "_srtp_salt");
  return m;
}

std::string media_json(const MediaReturn &m) {
  std::ostringstream ss;
  ss << "{\"port\":" << m.port << ",\"ssrc\":" << m.ssrc << ",\"srtp_key\":\""
     << base64_encode(m.srtp_key) << "\",\"srtp_salt\":\""
     << base64_encode(m.srtp_salt) << "\"}";
  return ss.str();
}

void send_error(httplib::Response &res, const std::exception_ptr &error) {
  const ErrorReply reply = classify_error(error);
  res.status = reply.status;
  res.set_content(build_error_json(reply.error, reply.details), kJson);
}

RouteHandler guarded(RouteHandler handler) {
  return [handler](const httplib::Request &req, httplib::Response &res) {
    try {
      handler(req, res);
    } catch (const std::exception &) {
      send_error(res, std::current_exception());
    }
  };
}

std::vector<RouteParam> video_params() {
  return {
      {"width", ParamType::Int, "", "Requested width", {}},
      {"height", ParamType::Int, "", "Requested height", {}},
      {"fps", ParamType::Int, "", "Requested frame rate", {}},
      {"video_bitrate", ParamType::Int, "0", "Requested bitrate (kbps)", {}},
      {"video_pt", ParamType::Int, "99", "RTP payload type", {}},
  };
}

std::vector<RouteParam> media_params(const std::string &prefix) {
  return {
      {prefix + "_port", ParamType::Int, "", "Controller RTP port", {}},
      {prefix + "_crypto_suite",
       ParamType::Select,
       "0",
       "SRTP crypto suite id",
       {"0", "1", "2"}},
      {prefix + "_srtp_key", ParamType::Base64, "", "SRTP master key", {}},
      {prefix + "_srtp_salt", ParamType::Base64, "", "SRTP master salt", {}},
  };
}

} // namespace

std::string json_array(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += "\"" + json_escape(items[i]) + "\"";
  }
  out += "]";
  return out;
}

std::string build_error_json(const std::string &msg,
                             const std::string &details) {
  std::string out = "{\"error\":\"" + json_escape(msg) + "\"";
  if (!details.empty())
    out += ",\"details\":\"" + json_escape(details) + "\"";
  out += "}";
  return out;
}

std::string prepare_response_json(const PrepareResponse &resp,
                                  AddressFamily family) {
  return "{\"address\":\"" + json_escape(resp.address) +
         "\",\"address_version\":\"" + address_family_label(family) +
         "\",\"video\":" + media_json(resp.video) +
         ",\"audio\":" + media_json(resp.audio) + "}";
}

std::string capabilities_json(const StreamingOptions &opts) {
  std::ostringstream ss;
  ss << "{\"stream_count\":" << opts.stream_count << ",\"crypto_suites\":[";
  for (size_t i = 0; i < opts.crypto_suites.size(); ++i) {
    if (i)
      ss << ",";
    ss << "{\"id\":" << static_cast<int>(opts.crypto_suites[i])
       << ",\"name\":\"" << crypto_suite_name(opts.crypto_suites[i]) << "\"}";
  }
  ss << "],\"resolutions\":[";
  for (size_t i = 0; i < opts.resolutions.size(); ++i) {
    const auto &r = opts.resolutions[i];
    if (i)
      ss << ",";
    ss << "[" << r.width << "," << r.height << "," << r.fps << "]";
  }
  ss << "],\"h264\":{\"profiles\":" << json_array(opts.h264_profiles)
     << ",\"levels\":" << json_array(opts.h264_levels) << "}"
     << ",\"audio\":{\"codec\":\"" << json_escape(opts.audio_codec)
     << "\",\"sample_rate\":" << opts.audio_sample_rate << "}}";
  return ss.str();
}

std::string sessions_json(const std::vector<std::string> &pending,
                          const std::vector<std::string> &ongoing) {
  return "{\"pending\":" + json_array(pending) +
         ",\"ongoing\":" + json_array(ongoing) + "}";
}

PrepareRequest parse_prepare(const std::string &session_id,
                             const httplib::Request &req) {
  PrepareRequest p;
  p.session_id = session_id;
  p.target_address = required_param(req, "address");
  const std::string version = param_or(req, "address_version", "ipv4");
  if (version == "ipv4")
    p.family = AddressFamily::V4;
  else if (version == "ipv6")
    p.family = AddressFamily::V6;
  else
    throw BadRequestError("address_version must be ipv4 or ipv6.");
  p.video = parse_media(req, "video");
  p.audio = parse_media(req, "audio");
  return p;
}

VideoRequest parse_video(const httplib::Request &req) {
  VideoRequest v;
  v.width = int_param(req, "width");
  v.height = int_param(req, "height");
  v.fps = int_param(req, "fps");
  v.max_bit_rate = int_param(req, "video_bitrate", 0);
  v.pt = int_param(req, "video_pt", v.pt);
  if (v.width <= 0 || v.height <= 0 || v.fps <= 0)
    throw BadRequestError("width, height and fps must be positive.");
  return v;
}

StartRequest parse_start(const std::string &session_id,
                         const httplib::Request &req) {
  StartRequest s;
  s.session_id = session_id;
  s.video = parse_video(req);
  s.audio.max_bit_rate = int_param(req, "audio_bitrate", 0);
  s.audio.sample_rate = int_param(req, "sample_rate", s.audio.sample_rate);
  s.audio.pt = int_param(req, "audio_pt", s.audio.pt);
  return s;
}

ErrorReply classify_error(const std::exception_ptr &error) {
  if (!error)
    return {200, "", ""};
  try {
    std::rethrow_exception(error);
  } catch (const BadRequestError &e) {
    return {400, "bad_request", e.what()};
  } catch (const SessionStateError &e) {
    return {409, "invalid_state", e.what()};
  } catch (const StreamLimitError &e) {
    return {503, "stream_limit", e.what()};
  } catch (const AddressResolutionError &e) {
    return {503, "unavailable", e.what()};
  } catch (const PortAllocationError &e) {
    return {503, "unavailable", e.what()};
  } catch (const ProcessSpawnError &e) {
    return {502, "stream_failed", e.what()};
  } catch (const ProcessRuntimeError &e) {
    return {502, "stream_failed", e.what()};
  } catch (const SnapshotError &e) {
    return {502, "snapshot_failed", e.what()};
  } catch (const std::exception &e) {
    return {500, "internal_error", e.what()};
  }
}

void add_routes(ApiRouter &router, boost::asio::io_context &io,
                SessionManager &manager, ApiOptions opts) {
  const auto deadline = opts.deadline;
  using Done = std::function<void(std::exception_ptr, bool)>;

  std::vector<RouteParam> prepare_params = {
      {"address", ParamType::String, "", "Controller address", {}},
      {"address_version",
       ParamType::Select,
       "ipv4",
       "Controller address family",
       {"ipv4", "ipv6"}},
  };
  for (auto &p : media_params("video"))
    prepare_params.push_back(p);
  for (auto &p : media_params("audio"))
    prepare_params.push_back(p);

  router.add_route(
      {"/session/{id}/prepare", "POST",
       "Allocate return ports, SSRCs and the local address for a session",
       prepare_params,
       guarded([&io, &manager, deadline](const httplib::Request &req,
                                         httplib::Response &res) {
         const PrepareRequest preq = parse_prepare(req.matches[1], req);
         const PrepareResponse resp = run_on_loop<PrepareResponse>(
             io,
             [&manager, preq](
                 std::function<void(std::exception_ptr, PrepareResponse)>
                     done) {
               manager.prepare_stream(
                   preq, [done](std::exception_ptr error,
                                const PrepareResponse &r) { done(error, r); });
             },
             deadline);
         res.set_content(prepare_response_json(resp, preq.family), kJson);
       })});

  std::vector<RouteParam> start_params = video_params();
  start_params.push_back(
      {"audio_bitrate", ParamType::Int, "0", "Audio bitrate (kbps)", {}});
  start_params.push_back(
      {"sample_rate", ParamType::Int, "16", "Audio sample rate (kHz)", {}});
  start_params.push_back(
      {"audio_pt", ParamType::Int, "110", "Audio RTP payload type", {}});

  router.add_route(
      {"/session/{id}/start", "POST",
       "Launch the transcoder for a prepared session", start_params,
       guarded([&io, &manager, deadline](const httplib::Request &req,
                                         httplib::Response &res) {
         const StartRequest sreq = parse_start(req.matches[1], req);
         run_on_loop<bool>(
             io,
             [&manager, sreq](Done done) {
               manager.start_stream(
                   sreq, [done](std::exception_ptr error) { done(error, true); });
             },
             deadline);
         res.set_content("{\"status\":\"streaming\",\"session\":\"" +
                             json_escape(sreq.session_id) + "\"}",
                         kJson);
       })});

  router.add_route(
      {"/session/{id}/reconfigure", "POST",
       "Acknowledge a reconfiguration request (the stream is left unchanged)",
       video_params(),
       guarded([&io, &manager, deadline](const httplib::Request &req,
                                         httplib::Response &res) {
         const std::string id = req.matches[1];
         const VideoRequest video = parse_video(req);
         run_on_loop<bool>(
             io,
             [&manager, id, video](Done done) {
               manager.reconfigure_stream(
                   id, video,
                   [done](std::exception_ptr error) { done(error, true); });
             },
             deadline);
         res.set_content("{\"status\":\"ignored\"}", kJson);
       })});

  router.add_route(
      {"/session/{id}/stop", "POST", "Stop a pending or streaming session", {},
       guarded([&io, &manager, deadline](const httplib::Request &req,
                                         httplib::Response &res) {
         const std::string id = req.matches[1];
         run_on_loop<bool>(
             io,
             [&manager, id](Done done) {
               manager.stop_stream(
                   id, [done](std::exception_ptr error) { done(error, true); });
             },
             deadline);
         res.set_content("{\"status\":\"stopped\"}", kJson);
       })});

  router.add_route(
      {"/sessions", "GET", "List pending and streaming session ids", {},
       guarded([&io, &manager, deadline](const httplib::Request &,
                                         httplib::Response &res) {
         const std::string body = run_on_loop<std::string>(
             io,
             [&manager](std::function<void(std::exception_ptr, std::string)>
                            done) {
               done(nullptr, sessions_json(manager.pending_ids(),
                                           manager.ongoing_ids()));
             },
             deadline);
         res.set_content(body, kJson);
       })});

  router.add_route(
      {"/snapshot",
       "GET",
       "Capture one still image (JPEG)",
       {{"w", ParamType::Int, "", "Width, defaults to the camera maximum", {}},
        {"h", ParamType::Int, "", "Height, defaults to the camera maximum", {}}},
       guarded([&io, &manager, deadline](const httplib::Request &req,
                                         httplib::Response &res) {
         const VideoConfig &cfg = manager.video_config();
         const int w = int_param(req, "w", cfg.max_width);
         const int h = int_param(req, "h", cfg.max_height);
         if (w <= 0 || h <= 0)
           throw BadRequestError("w and h must be positive.");
         std::string image = run_on_loop<std::string>(
             io,
             [&manager, w,
              h](std::function<void(std::exception_ptr, std::string)> done) {
               manager.handle_snapshot(
                   w, h, [done](std::exception_ptr error, std::string img) {
                     done(error, std::move(img));
                   });
             },
             deadline);
         res.set_content(image, "image/jpeg");
       })});

  router.add_route(
      {"/capabilities", "GET", "Advertised streaming options", {},
       guarded([&manager](const httplib::Request &, httplib::Response &res) {
         res.set_content(capabilities_json(manager.streaming_options()),
                         kJson);
       })});
}

} // namespace http
