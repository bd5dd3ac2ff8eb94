#pragma once

#include <sys/types.h>

#include <array>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "logger.hpp"
#include "transcode_args.hpp"
#include "types.hpp"

struct ExitStatus {
  int exit_code = -1;   // valid when term_signal == 0
  int term_signal = 0;
  bool stop_requested = false;
  std::string diagnostics;

  bool clean() const { return term_signal == 0 && exit_code == 0; }
  std::string describe() const;
};

// Severity used when relaying one transcoder stderr line.
bool is_fatal_diagnostic(const std::string &line);

// One external transcoder process. Lives on the event-loop thread; every
// callback below runs there and fires at most once.
class TranscodeProcess : public std::enable_shared_from_this<TranscodeProcess> {
public:
  enum class Mode { Stream, Snapshot };

  struct Options {
    std::string name;       // camera, for log lines
    std::string session_id; // empty for snapshots
    std::string processor = "ffmpeg";
    transcode::ArgList args;
    Mode mode = Mode::Stream;
    int return_port = 0; // stream mode: readiness listen port
    AddressFamily family = AddressFamily::V4;
    bool debug = false;
    std::chrono::milliseconds ready_timeout{15000}; // 0 = wait forever
    std::chrono::milliseconds kill_grace{2000};
  };

  // A null error means success.
  using StartCallback = std::function<void(std::exception_ptr error)>;
  using ExitCallback = std::function<void(const ExitStatus &status)>;
  using SnapshotCallback =
      std::function<void(std::exception_ptr error, std::string image)>;
  using StopCallback = std::function<void()>;

  TranscodeProcess(boost::asio::io_context &io, Logger &log, Options opts);
  ~TranscodeProcess();

  TranscodeProcess(const TranscodeProcess &) = delete;
  TranscodeProcess &operator=(const TranscodeProcess &) = delete;

  // Stream mode. Throws ProcessSpawnError / PortAllocationError; on throw no
  // callback fires.
  void start(StartCallback on_start, ExitCallback on_exit);
  // Snapshot mode. Throws ProcessSpawnError.
  void run_snapshot(SnapshotCallback on_done);

  // SIGINT, then SIGKILL after kill_grace. done fires once the process has
  // exited or the forced kill was sent. Safe to call repeatedly.
  void stop(StopCallback done);

  pid_t pid() const { return pid_; }
  bool started() const { return started_; }
  bool exited() const { return exited_; }
  bool finished() const { return finished_; }
  const std::string &diagnostics() const { return diagnostics_; }

private:
  void spawn();
  void listen_for_return_packet();
  void arm_ready_timer();
  void read_stdout();
  void read_stderr();
  void handle_stderr_data(const char *data, size_t len, bool eof);
  void wait_for_exit();
  void on_exited(int status);
  void try_finish();
  void finish();
  void complete_start(std::exception_ptr error);
  void resolve_stop_waiters();
  void close_all();

  Logger &log_;
  Options opts_;

  pid_t pid_ = -1;
  boost::asio::signal_set sigchld_;
  boost::asio::posix::stream_descriptor stdout_;
  boost::asio::posix::stream_descriptor stderr_;
  boost::asio::ip::udp::socket return_socket_;
  boost::asio::ip::udp::endpoint return_sender_;
  boost::asio::steady_timer ready_timer_;
  boost::asio::steady_timer kill_timer_;
  boost::asio::steady_timer drain_timer_;

  std::array<char, 4096> out_buf_{};
  std::array<char, 4096> err_buf_{};
  std::array<char, 2048> udp_buf_{};
  std::string line_buf_;
  std::string diagnostics_;
  std::string image_;

  StartCallback on_start_;
  ExitCallback on_exit_;
  SnapshotCallback on_snapshot_;
  std::vector<StopCallback> stop_waiters_;

  ExitStatus status_;
  bool started_ = false;
  bool exited_ = false;
  bool out_closed_ = false;
  bool err_closed_ = false;
  bool finished_ = false;
  bool term_sent_ = false;
  bool timed_out_ = false;
};
