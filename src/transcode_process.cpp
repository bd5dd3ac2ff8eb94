#include "transcode_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/v6_only.hpp>

#include "errors.hpp"

namespace {
constexpr size_t kMaxDiagnostics = 16 * 1024;
constexpr auto kDrainTimeout = std::chrono::seconds(2);

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string with_diagnostics(const std::string &msg, const std::string &diag) {
  if (diag.empty())
    return msg;
  return msg + "\n" + diag;
}
} // namespace

std::string ExitStatus::describe() const {
  if (term_signal != 0)
    return "signal " + std::to_string(term_signal);
  return "code " + std::to_string(exit_code);
}

bool is_fatal_diagnostic(const std::string &line) {
  const auto first = line.find_first_not_of(" \t");
  if (first == std::string::npos)
    return false;
  const std::string l = lowercase(line.substr(first));
  if (l.rfind("error", 0) == 0 || l.rfind("[error]", 0) == 0 ||
      l.rfind("[fatal]", 0) == 0)
    return true;
  // "-loglevel level+..." prints "[ctx @ 0x..] [error] message".
  return l.find("] [error]") != std::string::npos ||
         l.find("] [fatal]") != std::string::npos;
}

TranscodeProcess::TranscodeProcess(boost::asio::io_context &io, Logger &log,
                                   Options opts)
    : log_(log), opts_(std::move(opts)), sigchld_(io, SIGCHLD),
      stdout_(io), stderr_(io), return_socket_(io), ready_timer_(io),
      kill_timer_(io), drain_timer_(io) {}

TranscodeProcess::~TranscodeProcess() {
  // Never leave a child behind, whatever path got us here.
  if (pid_ > 0 && !exited_) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
}

void TranscodeProcess::spawn() {
  std::vector<std::string> storage;
  storage.reserve(opts_.args.size() + 1);
  storage.push_back(opts_.processor);
  storage.insert(storage.end(), opts_.args.begin(), opts_.args.end());
  std::vector<char *> argv;
  for (auto &s : storage)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  // All pipes are close-on-exec so concurrent children never hold each
  // other's write ends open.
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all_fds = [&]() {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
  };
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_all_fds();
    throw ProcessSpawnError("pipe failed: " + std::string(strerror(err)));
  }
  int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close_all_fds();
    close_fd(devnull);
    throw ProcessSpawnError("fork failed: " + std::string(strerror(err)));
  }
  if (pid == 0) {
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGINT, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    if (devnull >= 0)
      dup2(devnull, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);
  close_fd(devnull);

  // EOF means exec succeeded; an errno payload means it did not.
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_all_fds();
    throw ProcessSpawnError(opts_.processor + ": " + strerror(child_errno));
  }

  pid_ = pid;
  stdout_.assign(out_pipe[0]);
  stderr_.assign(err_pipe[0]);
}

void TranscodeProcess::start(StartCallback on_start, ExitCallback on_exit) {
  using boost::asio::ip::udp;

  // Bind before spawning so the first return packet cannot be missed.
  boost::system::error_code ec;
  const bool v6 = opts_.family == AddressFamily::V6;
  return_socket_.open(v6 ? udp::v6() : udp::v4(), ec);
  if (!ec && v6)
    return_socket_.set_option(boost::asio::ip::v6_only(false), ec);
  if (!ec)
    return_socket_.bind(
        udp::endpoint(v6 ? udp::v6() : udp::v4(),
                      static_cast<unsigned short>(opts_.return_port)),
        ec);
  if (ec) {
    boost::system::error_code ignored;
    return_socket_.close(ignored);
    throw PortAllocationError("Unable to listen on return port " +
                              std::to_string(opts_.return_port) + ": " +
                              ec.message());
  }

  try {
    spawn();
  } catch (const ProcessSpawnError &) {
    boost::system::error_code ignored;
    return_socket_.close(ignored);
    throw;
  }

  on_start_ = std::move(on_start);
  on_exit_ = std::move(on_exit);
  log_.debug("Transcoder started with PID " + std::to_string(pid_), opts_.name,
             opts_.debug);

  listen_for_return_packet();
  read_stdout();
  read_stderr();
  wait_for_exit();
  arm_ready_timer();
}

void TranscodeProcess::run_snapshot(SnapshotCallback on_done) {
  spawn();
  on_snapshot_ = std::move(on_done);
  read_stdout();
  read_stderr();
  wait_for_exit();
  arm_ready_timer();
}

void TranscodeProcess::listen_for_return_packet() {
  auto self = shared_from_this();
  return_socket_.async_receive_from(
      boost::asio::buffer(udp_buf_), return_sender_,
      [this, self](const boost::system::error_code &ec, std::size_t) {
        if (ec == boost::asio::error::operation_aborted || finished_)
          return;
        if (ec) {
          log_.debug("Return socket error: " + ec.message(), opts_.name,
                     opts_.debug);
          return;
        }
        log_.debug("Received first return packet from " +
                       return_sender_.address().to_string(),
                   opts_.name, opts_.debug);
        boost::system::error_code ignored;
        return_socket_.close(ignored);
        ready_timer_.cancel();
        complete_start(nullptr);
      });
}

void TranscodeProcess::arm_ready_timer() {
  if (opts_.ready_timeout.count() <= 0)
    return;
  auto self = shared_from_this();
  ready_timer_.expires_after(opts_.ready_timeout);
  ready_timer_.async_wait([this, self](const boost::system::error_code &ec) {
    if (ec || finished_ || exited_)
      return;
    if (opts_.mode == Mode::Stream && started_)
      return;
    timed_out_ = true;
    if (opts_.mode == Mode::Stream) {
      const std::string msg =
          "Stream did not start within " +
          std::to_string(opts_.ready_timeout.count()) + " ms.";
      log_.error(msg, opts_.name);
      complete_start(std::make_exception_ptr(
          ProcessRuntimeError(with_diagnostics(msg, diagnostics_))));
    } else {
      log_.error("Snapshot timed out.", opts_.name);
    }
    stop(nullptr);
  });
}

void TranscodeProcess::read_stdout() {
  auto self = shared_from_this();
  stdout_.async_read_some(
      boost::asio::buffer(out_buf_),
      [this, self](const boost::system::error_code &ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        if (ec) {
          out_closed_ = true;
          try_finish();
          return;
        }
        // The streaming path prints only an SDP here; nothing to keep.
        if (opts_.mode == Mode::Snapshot)
          image_.append(out_buf_.data(), n);
        read_stdout();
      });
}

void TranscodeProcess::read_stderr() {
  auto self = shared_from_this();
  stderr_.async_read_some(
      boost::asio::buffer(err_buf_),
      [this, self](const boost::system::error_code &ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        if (ec) {
          handle_stderr_data(nullptr, 0, true);
          err_closed_ = true;
          try_finish();
          return;
        }
        handle_stderr_data(err_buf_.data(), n, false);
        read_stderr();
      });
}

void TranscodeProcess::handle_stderr_data(const char *data, size_t len,
                                          bool eof) {
  if (data)
    line_buf_.append(data, len);

  auto emit = [this](const std::string &line) {
    if (line.empty())
      return;
    diagnostics_ += line;
    diagnostics_ += '\n';
    if (diagnostics_.size() > kMaxDiagnostics)
      diagnostics_.erase(0, diagnostics_.size() - kMaxDiagnostics);
    if (is_fatal_diagnostic(line)) {
      log_.error(line, opts_.name);
    } else {
      log_.debug(line, opts_.name, opts_.debug);
    }
  };

  size_t pos;
  while ((pos = line_buf_.find_first_of("\r\n")) != std::string::npos) {
    emit(line_buf_.substr(0, pos));
    line_buf_.erase(0, pos + 1);
  }
  if (eof) {
    emit(line_buf_);
    line_buf_.clear();
  }
}

void TranscodeProcess::wait_for_exit() {
  auto self = shared_from_this();
  sigchld_.async_wait(
      [this, self](const boost::system::error_code &ec, int) {
        if (ec == boost::asio::error::operation_aborted || exited_)
          return;
        int status = 0;
        const pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
          on_exited(status);
          return;
        }
        // Some other child; keep waiting for ours.
        wait_for_exit();
      });
}

void TranscodeProcess::on_exited(int status) {
  exited_ = true;
  if (WIFSIGNALED(status)) {
    status_.term_signal = WTERMSIG(status);
  } else if (WIFEXITED(status)) {
    status_.exit_code = WEXITSTATUS(status);
  }
  boost::system::error_code ignored;
  return_socket_.close(ignored);
  ready_timer_.cancel();

  auto self = shared_from_this();
  drain_timer_.expires_after(kDrainTimeout);
  drain_timer_.async_wait([this, self](const boost::system::error_code &ec) {
    if (ec || finished_)
      return;
    // A descendant still holds the pipes; do not wait for EOF any longer.
    handle_stderr_data(nullptr, 0, true);
    finish();
  });
  try_finish();
}

void TranscodeProcess::try_finish() {
  if (exited_ && out_closed_ && err_closed_ && !finished_)
    finish();
}

void TranscodeProcess::close_all() {
  boost::system::error_code ignored;
  ready_timer_.cancel();
  kill_timer_.cancel();
  drain_timer_.cancel();
  sigchld_.cancel(ignored);
  stdout_.close(ignored);
  stderr_.close(ignored);
  return_socket_.close(ignored);
}

void TranscodeProcess::finish() {
  finished_ = true;
  close_all();
  status_.stop_requested = term_sent_;
  status_.diagnostics = diagnostics_;

  log_.debug("Transcoder exited with " + status_.describe(), opts_.name,
             opts_.debug);

  if (opts_.mode == Mode::Stream) {
    if (!started_)
      complete_start(std::make_exception_ptr(ProcessRuntimeError(
          with_diagnostics("Transcoder exited with " + status_.describe() +
                               " before the stream started.",
                           diagnostics_))));
    auto on_exit = std::move(on_exit_);
    on_exit_ = nullptr;
    if (on_exit)
      on_exit(status_);
  } else {
    auto on_done = std::move(on_snapshot_);
    on_snapshot_ = nullptr;
    if (on_done) {
      if (timed_out_) {
        on_done(std::make_exception_ptr(SnapshotError(
                    with_diagnostics("Snapshot timed out.", diagnostics_))),
                {});
      } else if (!status_.clean() || image_.empty()) {
        on_done(std::make_exception_ptr(SnapshotError(with_diagnostics(
                    "Snapshot failed (" + status_.describe() + ", " +
                        std::to_string(image_.size()) + " bytes).",
                    diagnostics_))),
                {});
      } else {
        on_done(nullptr, std::move(image_));
      }
    }
  }
  resolve_stop_waiters();
}

void TranscodeProcess::complete_start(std::exception_ptr error) {
  if (!on_start_)
    return;
  auto cb = std::move(on_start_);
  on_start_ = nullptr;
  started_ = !error;
  cb(error);
}

void TranscodeProcess::resolve_stop_waiters() {
  auto waiters = std::move(stop_waiters_);
  stop_waiters_.clear();
  for (auto &w : waiters)
    w();
}

void TranscodeProcess::stop(StopCallback done) {
  if (finished_ || pid_ <= 0) {
    if (done)
      done();
    return;
  }
  if (done)
    stop_waiters_.push_back(std::move(done));
  if (exited_ || term_sent_)
    return;

  term_sent_ = true;
  log_.debug("Sending SIGINT to transcoder PID " + std::to_string(pid_),
             opts_.name, opts_.debug);
  ::kill(pid_, SIGINT);

  auto self = shared_from_this();
  kill_timer_.expires_after(opts_.kill_grace);
  kill_timer_.async_wait([this, self](const boost::system::error_code &ec) {
    if (ec || exited_)
      return;
    log_.warn("Transcoder PID " + std::to_string(pid_) +
                  " ignored SIGINT, sending SIGKILL.",
              opts_.name);
    ::kill(pid_, SIGKILL);
    resolve_stop_waiters();
  });
}
