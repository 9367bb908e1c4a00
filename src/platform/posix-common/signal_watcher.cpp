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
#include "platform/posix-common/signal_watcher.hpp"

#include <cstring>
#include <ctime>
#include <utility>

#include <pthread.h>
#include <signal.h>

#include <spdlog/spdlog.h>

namespace gdbflash::posix_common {

namespace {

constexpr int kWatched[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

sigset_t watched_set() {
  sigset_t set{};
  sigemptyset(&set);
  for (int s : kWatched) sigaddset(&set, s);
  return set;
}

// Waits up to `ms` for one of `set`; 0 when nothing arrived.
int wait_for(const sigset_t& set, long ms) {
  const timespec ts{.tv_sec = ms / 1000, .tv_nsec = (ms % 1000) * 1'000'000L};
  const int r = ::sigtimedwait(&set, nullptr, &ts);
  return r > 0 ? r : 0;
}

} // namespace

const char* SignalWatcher::name(int signo) noexcept {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    case SIGQUIT: return "SIGQUIT";
    default: return "signal";
  }
}

core::Result<std::unique_ptr<SignalWatcher>> SignalWatcher::watch(std::stop_source stop, Notice notice) {
  using R = core::Result<std::unique_ptr<SignalWatcher>>;
  if (!stop.stop_possible()) return R::Fail(core::ErrorKind::Config, "signal watcher needs a stop source");

  const sigset_t set = watched_set();
  sigset_t old{};
  if (const int e = ::pthread_sigmask(SIG_BLOCK, &set, &old); e != 0)
    return R::Failf(core::ErrorKind::Startup, "pthread_sigmask: {}", std::strerror(e));

  std::unique_ptr<SignalWatcher> w(new SignalWatcher(std::move(stop), std::move(notice), old));
  w->thread_ = std::jthread([p = w.get()](std::stop_token st) { p->loop_(st); });
  return R::Ok(std::move(w));
}

SignalWatcher::SignalWatcher(std::stop_source stop, Notice notice, sigset_t old_mask)
  : stop_(std::move(stop)), notice_(std::move(notice)), old_mask_(old_mask) {}

SignalWatcher::~SignalWatcher() {
  thread_.request_stop();
  if (thread_.joinable()) thread_.join();

  // Unblocking with a signal still pending would deliver it with its default
  // action; consume it here instead.
  const sigset_t set = watched_set();
  while (const int s = wait_for(set, 0)) {
    received_.fetch_add(1);
    spdlog::debug("{} arrived during shutdown", name(s));
  }

  (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

void SignalWatcher::loop_(std::stop_token st) {
  const sigset_t set = watched_set();
  while (!st.stop_requested()) {
    const int s = wait_for(set, 100);
    if (!s) continue;

    const unsigned n = received_.fetch_add(1) + 1;
    if (n == 1) spdlog::warn("{} received, cancelling", name(s));
    stop_.request_stop();
    if (notice_) notice_(s, n);
  }
}

} // namespace gdbflash::posix_common
