#include "session_manager.hpp"

#include <algorithm>
#include <exception>
#include <limits>

#include "config.hpp"
#include "errors.hpp"
#include "negotiator.hpp"
#include "transcode_args.hpp"

namespace {
std::vector<uint8_t> concat(const std::vector<uint8_t> &a,
                            const std::vector<uint8_t> &b) {
  std::vector<uint8_t> out(a);
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

std::string describe_request(const VideoRequest &v) {
  return std::to_string(v.width) + "x" + std::to_string(v.height) + ", " +
         std::to_string(v.fps) + " fps, " + std::to_string(v.max_bit_rate) +
         " kbps";
}
} // namespace

SessionManager::SessionManager(boost::asio::io_context &io, Logger &log,
                               AddressResolver &resolver, Options opts)
    : io_(io), log_(log), resolver_(resolver), opts_(std::move(opts)),
      ports_(io), rng_(std::random_device{}()) {
  validate_video_config(opts_.video);
}

SessionManager::~SessionManager() {
  alive_.reset();
  // Dropping the last references SIGKILLs anything still running.
  for (auto &kv : ongoing_)
    kv.second.process->stop(nullptr);
  for (auto &kv : snapshots_)
    kv.second->stop(nullptr);
}

std::string SessionManager::resolve_address(AddressFamily family) {
  try {
    return resolver_.resolve(family, opts_.interface_name);
  } catch (const AddressResolutionError &e) {
    if (opts_.interface_name.empty())
      throw;
    log_.warn(std::string(e.what()) + " Falling back to default.", opts_.name);
    return resolver_.resolve(family, "");
  }
}

int32_t SessionManager::generate_ssrc() {
  std::uniform_int_distribution<int32_t> dist(
      std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());
  for (;;) {
    const int32_t ssrc = dist(rng_);
    if (ssrc != 0 && issued_ssrcs_.insert(ssrc).second)
      return ssrc;
  }
}

void SessionManager::release_ports(const SessionInfo &info) {
  ports_.release(info.video_return_port);
  ports_.release(info.audio_return_port);
}

void SessionManager::prepare_stream(const PrepareRequest &req,
                                    PrepareCallback cb) {
  const std::string &id = req.session_id;
  try {
    if (shutting_down_)
      throw SessionStateError("Shutting down.");
    if (ongoing_.count(id))
      throw SessionStateError("Session " + id + " is already streaming.");

    auto stale = pending_.find(id);
    if (stale != pending_.end()) {
      log_.debug("Replacing pending session " + id, opts_.name,
                 opts_.video.debug);
      release_ports(stale->second);
      pending_.erase(stale);
    }

    if (static_cast<int>(pending_.size() + ongoing_.size()) >=
        opts_.video.max_streams)
      throw StreamLimitError("Maximum of " +
                             std::to_string(opts_.video.max_streams) +
                             " streams reached.");
    if (!crypto_suite_supported(req.video.crypto_suite) ||
        !crypto_suite_supported(req.audio.crypto_suite))
      throw SessionStateError("Unsupported SRTP crypto suite.");

    const std::string local_address = resolve_address(req.family);

    SessionInfo info;
    info.address = req.target_address;
    info.family = req.family;
    info.video_return_port = ports_.allocate();
    try {
      info.audio_return_port = ports_.allocate();
    } catch (const PortAllocationError &) {
      ports_.release(info.video_return_port);
      throw;
    }

    info.video_port = req.video.port;
    info.video_crypto_suite = req.video.crypto_suite;
    info.video_srtp = concat(req.video.srtp_key, req.video.srtp_salt);
    info.video_ssrc = generate_ssrc();

    info.audio_port = req.audio.port;
    info.audio_crypto_suite = req.audio.crypto_suite;
    info.audio_srtp = concat(req.audio.srtp_key, req.audio.srtp_salt);
    info.audio_ssrc = generate_ssrc();

    PrepareResponse resp;
    resp.address = local_address;
    resp.video = {info.video_return_port, info.video_ssrc, req.video.srtp_key,
                  req.video.srtp_salt};
    resp.audio = {info.audio_return_port, info.audio_ssrc, req.audio.srtp_key,
                  req.audio.srtp_salt};

    pending_[id] = info;
    log_.debug("Prepared session " + id + " for " + info.address +
                   " (return ports " + std::to_string(info.video_return_port) +
                   "/" + std::to_string(info.audio_return_port) + ")",
               opts_.name, opts_.video.debug);
    cb(nullptr, resp);
  } catch (const CamBridgeError &e) {
    log_.error("Failed to prepare stream: " + std::string(e.what()),
               opts_.name);
    cb(std::current_exception(), PrepareResponse{});
  }
}

void SessionManager::start_stream(const StartRequest &req, StreamCallback cb) {
  const std::string &id = req.session_id;
  if (shutting_down_) {
    cb(std::make_exception_ptr(SessionStateError("Shutting down.")));
    return;
  }
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    const std::string msg = "No prepared session " + id + " to start.";
    log_.error(msg, opts_.name);
    cb(std::make_exception_ptr(SessionStateError(msg)));
    return;
  }

  const VideoConfig &cfg = opts_.video;
  SessionInfo info = it->second;
  pending_.erase(it);

  const ResolutionInfo res = negotiate::determine_resolution(
      req.video.width, req.video.height, cfg);
  const int fps = negotiate::clamp_fps(req.video.fps, cfg);
  const Bitrates bitrates = negotiate::clamp_bitrates(
      req.video.max_bit_rate, req.audio.max_bit_rate, cfg);

  log_.debug("Video stream requested: " + describe_request(req.video),
             opts_.name, cfg.debug);
  log_.info("Starting video stream: " + std::to_string(res.width) + "x" +
                std::to_string(res.height) + ", " + std::to_string(fps) +
                " fps, " + std::to_string(bitrates.video_kbps) + " kbps",
            opts_.name);

  transcode::StreamParams params;
  params.fps = fps;
  params.video_pt = req.video.pt;
  params.audio_pt = req.audio.pt;
  params.sample_rate = req.audio.sample_rate;

  TranscodeProcess::Options popts;
  popts.name = opts_.name;
  popts.session_id = id;
  popts.processor = opts_.processor;
  popts.args = transcode::build_stream_args(cfg, res, bitrates, info, params);
  popts.mode = TranscodeProcess::Mode::Stream;
  popts.return_port = info.video_return_port;
  popts.family = info.family;
  popts.debug = cfg.debug;
  popts.ready_timeout = opts_.ready_timeout;
  popts.kill_grace = opts_.kill_grace;

  log_.debug("Stream command: " + opts_.processor + " " +
                 transcode::join_args(popts.args),
             opts_.name, cfg.debug);

  auto process = std::make_shared<TranscodeProcess>(io_, log_, popts);
  ongoing_[id] = OngoingSession{info, process};

  std::weak_ptr<bool> alive = alive_;
  const TranscodeProcess *raw = process.get();
  try {
    process->start(
        [this, alive, id, cb](std::exception_ptr error) {
          if (!alive.lock())
            return;
          if (error)
            log_.error("Stream " + id + " failed to start.", opts_.name);
          cb(error);
        },
        [this, alive, id, raw](const ExitStatus &status) {
          if (!alive.lock())
            return;
          handle_process_exit(id, raw, status);
        });
  } catch (const CamBridgeError &e) {
    ongoing_.erase(id);
    release_ports(info);
    log_.error("Failed to start video process: " + std::string(e.what()),
               opts_.name);
    cb(std::current_exception());
  }
}

void SessionManager::handle_process_exit(const std::string &session_id,
                                         const TranscodeProcess *process,
                                         const ExitStatus &status) {
  auto it = ongoing_.find(session_id);
  // Already removed by stop_stream, or the id was reused by a newer stream.
  if (it == ongoing_.end() || it->second.process.get() != process)
    return;

  if (status.stop_requested) {
    log_.info("Video process for session " + session_id + " ended (" +
                  status.describe() + ").",
              opts_.name);
  } else {
    log_.error("Transcoder for session " + session_id +
                   " exited unexpectedly with " + status.describe() + ".",
               opts_.name);
  }
  release_ports(it->second.info);
  ongoing_.erase(it);
}

void SessionManager::reconfigure_stream(const std::string &session_id,
                                        const VideoRequest &video,
                                        StreamCallback cb) {
  log_.debug("Received request to reconfigure " + session_id + ": " +
                 describe_request(video) + " (Ignored)",
             opts_.name, opts_.video.debug);
  cb(nullptr);
}

void SessionManager::stop_stream(const std::string &session_id,
                                 StreamCallback cb) {
  auto pending = pending_.find(session_id);
  if (pending != pending_.end()) {
    release_ports(pending->second);
    pending_.erase(pending);
    log_.debug("Discarded pending session " + session_id, opts_.name,
               opts_.video.debug);
    cb(nullptr);
    return;
  }

  auto it = ongoing_.find(session_id);
  if (it == ongoing_.end()) {
    cb(nullptr);
    return;
  }

  auto process = it->second.process;
  release_ports(it->second.info);
  ongoing_.erase(it);

  std::weak_ptr<bool> alive = alive_;
  process->stop([this, alive, cb]() {
    if (alive.lock())
      log_.info("Stopped video stream.", opts_.name);
    cb(nullptr);
  });
}

void SessionManager::handle_snapshot(int width, int height,
                                     SnapshotCallback cb) {
  const VideoConfig &cfg = opts_.video;
  if (shutting_down_) {
    cb(std::make_exception_ptr(SessionStateError("Shutting down.")), {});
    return;
  }
  const ResolutionInfo res = negotiate::determine_resolution(width, height, cfg);

  TranscodeProcess::Options popts;
  popts.name = opts_.name;
  popts.processor = opts_.processor;
  popts.args = transcode::build_snapshot_args(cfg, res);
  popts.mode = TranscodeProcess::Mode::Snapshot;
  popts.debug = cfg.debug;
  popts.ready_timeout = opts_.ready_timeout;
  popts.kill_grace = opts_.kill_grace;

  log_.debug("Snapshot requested: " + std::to_string(width) + "x" +
                 std::to_string(height),
             opts_.name, cfg.debug);
  log_.debug("Sending snapshot: " + std::to_string(res.width) + "x" +
                 std::to_string(res.height),
             opts_.name, cfg.debug);
  log_.debug("Snapshot command: " + opts_.processor + " " +
                 transcode::join_args(popts.args),
             opts_.name, cfg.debug);

  auto process = std::make_shared<TranscodeProcess>(io_, log_, popts);
  const TranscodeProcess *raw = process.get();
  snapshots_[raw] = process;

  std::weak_ptr<bool> alive = alive_;
  try {
    process->run_snapshot(
        [this, alive, raw, cb](std::exception_ptr error, std::string image) {
          if (alive.lock()) {
            snapshots_.erase(raw);
            if (error)
              log_.error("An error occurred while making snapshot request: " +
                             error_message(error),
                         opts_.name);
          }
          cb(error, std::move(image));
        });
  } catch (const CamBridgeError &e) {
    snapshots_.erase(raw);
    log_.error("An error occurred while making snapshot request: " +
                   std::string(e.what()),
               opts_.name);
    cb(std::current_exception(), {});
  }
}

void SessionManager::shutdown(DoneCallback done) {
  if (shutdown_done_) {
    if (done)
      done();
    return;
  }
  if (done)
    shutdown_waiters_.push_back(std::move(done));
  if (shutting_down_)
    return;
  shutting_down_ = true;

  for (auto &kv : pending_)
    release_ports(kv.second);
  pending_.clear();

  const std::vector<std::string> ids = ongoing_ids();
  std::vector<std::shared_ptr<TranscodeProcess>> snaps;
  for (auto &kv : snapshots_)
    snaps.push_back(kv.second);

  // One extra count so completion cannot fire before every stop is issued.
  auto remaining = std::make_shared<size_t>(ids.size() + snaps.size() + 1);
  std::weak_ptr<bool> alive = alive_;
  auto one_done = [this, alive, remaining]() {
    if (--*remaining != 0 || !alive.lock())
      return;
    shutdown_done_ = true;
    log_.debug("All sessions stopped.", opts_.name, opts_.video.debug);
    auto waiters = std::move(shutdown_waiters_);
    shutdown_waiters_.clear();
    for (auto &w : waiters)
      w();
  };

  for (const auto &id : ids) {
    try {
      stop_stream(id, [one_done](std::exception_ptr) { one_done(); });
    } catch (const std::exception &e) {
      log_.error("Error occurred terminating video process: " +
                     std::string(e.what()),
                 opts_.name);
      one_done();
    }
  }
  for (auto &p : snaps) {
    try {
      p->stop(one_done);
    } catch (const std::exception &e) {
      log_.error("Error occurred terminating snapshot process: " +
                     std::string(e.what()),
                 opts_.name);
      one_done();
    }
  }
  one_done();
}

StreamingOptions SessionManager::streaming_options() const {
  return make_streaming_options(opts_.video);
}

bool SessionManager::has_pending(const std::string &session_id) const {
  return pending_.count(session_id) != 0;
}

bool SessionManager::has_ongoing(const std::string &session_id) const {
  return ongoing_.count(session_id) != 0;
}

std::optional<SessionInfo>
SessionManager::pending_session(const std::string &id) const {
  auto it = pending_.find(id);
  if (it == pending_.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string> SessionManager::pending_ids() const {
  std::vector<std::string> ids;
  for (const auto &kv : pending_)
    ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<std::string> SessionManager::ongoing_ids() const {
  std::vector<std::string> ids;
  for (const auto &kv : ongoing_)
    ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<pid_t> SessionManager::live_pids() const {
  std::vector<pid_t> pids;
  for (const auto &kv : ongoing_) {
    if (!kv.second.process->exited())
      pids.push_back(kv.second.process->pid());
  }
  for (const auto &kv : snapshots_) {
    if (!kv.second->exited())
      pids.push_back(kv.second->pid());
  }
  return pids;
}
