#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "address_resolver.hpp"
#include "logger.hpp"
#include "port_allocator.hpp"
#include "streaming_options.hpp"
#include "transcode_process.hpp"
#include "types.hpp"

// Streaming sessions of one camera. A session id is either pending (prepared,
// ports and keys allocated) or ongoing (transcoder running), never both.
//
// Not thread-safe: every call must be made on the io_context thread, and all
// callbacks are invoked there exactly once.
class SessionManager {
public:
  struct Options {
    std::string name = "Camera";
    VideoConfig video;
    std::string processor = "ffmpeg";
    std::string interface_name;
    std::chrono::milliseconds ready_timeout{15000};
    std::chrono::milliseconds kill_grace{2000};
  };

  // A null error means success; otherwise it holds a CamBridgeError.
  using PrepareCallback =
      std::function<void(std::exception_ptr error, const PrepareResponse &)>;
  using StreamCallback = std::function<void(std::exception_ptr error)>;
  using SnapshotCallback = TranscodeProcess::SnapshotCallback;
  using DoneCallback = std::function<void()>;

  // Throws ConfigurationError when opts.video is unusable.
  SessionManager(boost::asio::io_context &io, Logger &log,
                 AddressResolver &resolver, Options opts);
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  void prepare_stream(const PrepareRequest &req, PrepareCallback cb);
  void start_stream(const StartRequest &req, StreamCallback cb);
  // Acknowledged without touching the running transcoder.
  void reconfigure_stream(const std::string &session_id,
                          const VideoRequest &video, StreamCallback cb);
  // No-op for unknown or already stopped sessions.
  void stop_stream(const std::string &session_id, StreamCallback cb);
  void handle_snapshot(int width, int height, SnapshotCallback cb);

  // Stops every session and snapshot; done fires once all have resolved.
  // Later calls only wait for (or observe) the same completion.
  void shutdown(DoneCallback done);

  StreamingOptions streaming_options() const;
  const std::string &name() const { return opts_.name; }
  const VideoConfig &video_config() const { return opts_.video; }

  bool has_pending(const std::string &session_id) const;
  bool has_ongoing(const std::string &session_id) const;
  std::optional<SessionInfo> pending_session(const std::string &id) const;
  std::vector<std::string> pending_ids() const;
  std::vector<std::string> ongoing_ids() const;
  // Transcoders that have not been reaped yet (streams and snapshots).
  std::vector<pid_t> live_pids() const;
  bool shutting_down() const { return shutting_down_; }

private:
  struct OngoingSession {
    SessionInfo info;
    std::shared_ptr<TranscodeProcess> process;
  };

  std::string resolve_address(AddressFamily family);
  int32_t generate_ssrc();
  void release_ports(const SessionInfo &info);
  void handle_process_exit(const std::string &session_id,
                           const TranscodeProcess *process,
                           const ExitStatus &status);

  boost::asio::io_context &io_;
  Logger &log_;
  AddressResolver &resolver_;
  Options opts_;
  PortAllocator ports_;
  std::mt19937 rng_;
  std::set<int32_t> issued_ssrcs_;

  std::unordered_map<std::string, SessionInfo> pending_;
  std::unordered_map<std::string, OngoingSession> ongoing_;
  std::map<const TranscodeProcess *, std::shared_ptr<TranscodeProcess>>
      snapshots_;

  bool shutting_down_ = false;
  bool shutdown_done_ = false;
  std::vector<DoneCallback> shutdown_waiters_;

  // Expires with the manager; callbacks still queued on the io_context check
  // it before touching members.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
