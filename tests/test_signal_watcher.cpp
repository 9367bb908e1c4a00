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

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <stop_token>
#include <string_view>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

using gdbflash::core::ErrorKind;
using gdbflash::posix_common::SignalWatcher;

static bool wait_until(const std::function<bool()>& pred, int ms = 2000) {
  const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

static bool blocked(int signo) {
  sigset_t cur{};
  pthread_sigmask(SIG_BLOCK, nullptr, &cur);
  return sigismember(&cur, signo) == 1;
}

static void test_signal_requests_stop() {
  std::stop_source stop;
  std::atomic<int> last_signo{0};
  std::atomic<unsigned> last_count{0};

  auto r = SignalWatcher::watch(stop, [&](int signo, unsigned count) {
    last_signo = signo;
    last_count = count;
  });
  check("watch_ok", static_cast<bool>(r));
  if (!r) return;
  auto& w = *r.value;

  check("masked_while_watching", blocked(SIGINT) && blocked(SIGTERM) && blocked(SIGHUP) && blocked(SIGQUIT));
  check("idle_no_stop", !wait_until([&] { return stop.stop_requested(); }, 150) && w.received() == 0);

  ::kill(::getpid(), SIGINT);
  check("sigint_stops", wait_until([&] { return stop.stop_requested(); }));
  check("sigint_notice", wait_until([&] { return last_count.load() == 1; }) && last_signo.load() == SIGINT);
  check("cancelled", w.cancelled() && w.received() == 1);

  ::kill(::getpid(), SIGTERM);
  check("repeat_notice", wait_until([&] { return last_count.load() == 2; }) && last_signo.load() == SIGTERM);
  check("repeat_counted", w.received() == 2 && stop.stop_requested());
}

static void test_mask_restored() {
  const bool before = blocked(SIGINT);
  {
    std::stop_source stop;
    auto r = SignalWatcher::watch(stop);
    check("watch_without_notice", static_cast<bool>(r));
    check("blocked_inside", blocked(SIGINT));

    ::kill(::getpid(), SIGHUP);
    check("hup_without_notice", wait_until([&] { return stop.stop_requested(); }));
  }
  check("mask_restored", blocked(SIGINT) == before && !blocked(SIGHUP));
}

static void test_rejects_detached_source() {
  auto r = SignalWatcher::watch(std::stop_source(std::nostopstate));
  check("detached_source_config", !r && r.st.kind == ErrorKind::Config);
  check("detached_source_no_mask", !blocked(SIGTERM));
}

static void test_names() {
  check("name_int", std::string_view(SignalWatcher::name(SIGINT)) == "SIGINT");
  check("name_quit", std::string_view(SignalWatcher::name(SIGQUIT)) == "SIGQUIT");
  check("name_other", std::string_view(SignalWatcher::name(SIGUSR1)) == "signal");
}

int main() {
  spdlog::set_level(spdlog::level::off);

  test_rejects_detached_source();
  test_names();
  test_signal_requests_stop();
  test_mask_restored();

  std::fprintf(stdout, "signal_watcher: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
