/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "platform/posix-common/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace gdbflash::posix_common {

using core::ErrorKind;

namespace {

constexpr int kPollSliceMs = 100;

int ms_until(core::Clock::time_point deadline) {
  const auto d = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - core::Clock::now()).count();
  return d <= 0 ? 0 : static_cast<int>(std::min<long long>(d, 1'000'000'000LL));
}

} // namespace

core::Result<std::unique_ptr<Subprocess>> Subprocess::spawn(std::string program,
                                                             std::vector<std::string> args) noexcept
{
  using R = core::Result<std::unique_ptr<Subprocess>>;

  // A dead child must not kill us on the next write.
  ::signal(SIGPIPE, SIG_IGN);

  int to_child[2]{-1, -1};
  int from_child[2]{-1, -1};
  int exec_err[2]{-1, -1};

  if (::pipe2(to_child, O_CLOEXEC) != 0) return R::Failf(ErrorKind::Startup, "pipe: {}", std::strerror(errno));
  FileHandle child_in_r(to_child[0]), child_in_w(to_child[1]);

  if (::pipe2(from_child, O_CLOEXEC) != 0) return R::Failf(ErrorKind::Startup, "pipe: {}", std::strerror(errno));
  FileHandle child_out_r(from_child[0]), child_out_w(from_child[1]);

  if (::pipe2(exec_err, O_CLOEXEC) != 0) return R::Failf(ErrorKind::Startup, "pipe: {}", std::strerror(errno));
  FileHandle err_r(exec_err[0]), err_w(exec_err[1]);

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(program.data());
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) return R::Failf(ErrorKind::Startup, "fork: {}", std::strerror(errno));

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    ::setpgid(0, 0);

    if (::dup2(child_in_r.fd, STDIN_FILENO) < 0 ||
        ::dup2(child_out_w.fd, STDOUT_FILENO) < 0 ||
        ::dup2(child_out_w.fd, STDERR_FILENO) < 0) {
      const int e = errno;
      (void)!::write(err_w.fd, &e, sizeof(e));
      ::_exit(127);
    }

    ::execvp(argv[0], argv.data());

    const int e = errno;
    (void)!::write(err_w.fd, &e, sizeof(e));
    ::_exit(127);
  }

  child_in_r.close();
  child_out_w.close();
  err_w.close();

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(err_r.fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    return R::Failf(ErrorKind::Startup, "Cannot execute {}: {}", program, std::strerror(child_errno));
  }

  spdlog::debug("Spawned {} (pid {})", program, pid);
  return R::Ok(std::unique_ptr<Subprocess>(
    new Subprocess(std::move(program), pid, std::move(child_in_w), std::move(child_out_r))));
}

Subprocess::Subprocess(std::string program, pid_t pid, FileHandle in, FileHandle out)
  : program_(std::move(program)), pid_(pid), in_(std::move(in)), out_(std::move(out))
{}

Subprocess::~Subprocess() { close(); }

std::string Subprocess::label() const {
  return fmt::format("{}[{}]", program_, pid_);
}

bool Subprocess::reap_(bool block) const noexcept {
  if (reaped_ || pid_ <= 0) return true;

  int st = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &st, block ? 0 : WNOHANG);
  } while (r < 0 && errno == EINTR);

  if (r == 0) return false;
  reaped_ = true;
  if (r == pid_) {
    if (WIFEXITED(st)) exit_status_ = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) exit_status_ = 128 + WTERMSIG(st);
  }
  return true;
}

bool Subprocess::wait_exit_(int ms) const noexcept {
  const auto deadline = core::Clock::now() + std::chrono::milliseconds(ms);
  for (;;) {
    if (reap_(false)) return true;
    if (core::Clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

bool Subprocess::alive() const noexcept {
  return pid_ > 0 && !reap_(false);
}

core::Status Subprocess::write_line(std::string_view line) {
  if (!in_.valid()) return core::Status::Failf(ErrorKind::Io, "{}: stdin closed", label());

  std::string data;
  data.reserve(line.size() + 1);
  data.append(line);
  data.push_back('\n');

  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = do_write(in_, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<std::size_t>(n);
      continue;
    }
    const int e = errno;
    if (n < 0 && (e == EINTR || e == EAGAIN)) continue;
    return core::Status::Failf(ErrorKind::Io, "{}: write failed: {}", label(), std::strerror(e));
  }
  return core::Status::Ok();
}

std::optional<std::string> Subprocess::take_line_() {
  const auto nl = buf_.find('\n');
  if (nl == std::string::npos) return std::nullopt;

  std::string line = buf_.substr(0, nl);
  buf_.erase(0, nl + 1);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

core::Result<std::string> Subprocess::read_line(core::Clock::time_point deadline, std::stop_token st) {
  using R = core::Result<std::string>;

  for (;;) {
    if (auto line = take_line_()) return R::Ok(std::move(*line));

    if (eof_) {
      if (!buf_.empty()) return R::Ok(std::exchange(buf_, {}));
      return R::Failf(ErrorKind::Io, "{}: output closed (process exited?)", label());
    }

    if (st.stop_requested()) return R::Fail(ErrorKind::Cancelled, "read cancelled", buf_);

    const int ms_left = ms_until(deadline);
    if (ms_left <= 0) return R::Fail(ErrorKind::Timeout, fmt::format("{}: no complete line before deadline", label()), buf_);

    short revents = 0;
    const int pr = do_poll(out_, POLLIN, std::min(ms_left, kPollSliceMs), &revents);
    if (pr == 0) continue;
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      return R::Failf(ErrorKind::Io, "{}: poll: {}", label(), std::strerror(e));
    }

    if (revents & POLLNVAL) return R::Failf(ErrorKind::Io, "{}: output not open", label());

    char tmp[4096];
    const ssize_t n = do_read(out_, tmp, sizeof(tmp));
    if (n > 0) {
      buf_.append(tmp, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      eof_ = true;
      continue;
    }

    const int e = errno;
    if (e == EINTR || e == EAGAIN) continue;
    return R::Failf(ErrorKind::Io, "{}: read: {}", label(), std::strerror(e));
  }
}

void Subprocess::close() noexcept {
  if (pid_ <= 0) return;

  in_.close();

  if (!wait_exit_(grace_ms_)) {
    spdlog::debug("{}: still running, sending SIGTERM", label());
    (void)::kill(pid_, SIGTERM);
    if (!wait_exit_(grace_ms_)) {
      spdlog::warn("{}: did not exit, sending SIGKILL", label());
      (void)::kill(pid_, SIGKILL);
      (void)reap_(true);
    }
  }

  out_.close();
  if (exit_status_) spdlog::debug("{}: exited with status {}", label(), *exit_status_);
  pid_ = -1;
}

} // namespace gdbflash::posix_common
