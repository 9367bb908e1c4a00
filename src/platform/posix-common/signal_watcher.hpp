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
#pragma once

#include "core/status.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>

#include <signal.h>

namespace gdbflash::posix_common {

// Turns SIGINT, SIGTERM, SIGHUP and SIGQUIT into a stop request on a run's
// stop_source. The signals are blocked in the calling thread, so watch()
// must run before any other thread is started. Threads and children created
// afterwards inherit the mask; Subprocess clears it in the child.
//
// Destruction joins the watcher, discards signals still pending and
// restores the previous mask.
class SignalWatcher {
public:
  // Called from the watcher thread for every signal, after the stop request.
  using Notice = std::function<void(int signo, unsigned count)>;

  static core::Result<std::unique_ptr<SignalWatcher>> watch(std::stop_source stop, Notice notice = {});

  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  unsigned received() const noexcept { return received_.load(); }
  bool cancelled() const noexcept { return stop_.stop_requested(); }

  static const char* name(int signo) noexcept;

private:
  SignalWatcher(std::stop_source stop, Notice notice, sigset_t old_mask);

  void loop_(std::stop_token st);

  std::stop_source stop_;
  Notice notice_;
  sigset_t old_mask_{};
  std::atomic<unsigned> received_{0};
  std::jthread thread_;
};

} // namespace gdbflash::posix_common
