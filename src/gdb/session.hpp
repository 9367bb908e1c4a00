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
#include "core/text_channel.hpp"
#include "gdb/response.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace gdbflash::gdb {

struct LaunchSpec {
  std::string gdb_path = "arm-none-eabi-gdb";
  std::filesystem::path executable;
  std::string endpoint = "localhost:61234";
  bool extended_remote = false;
  std::vector<std::string> extra_args;
};

struct SessionCfg {
  int response_timeout_ms = 5'000;
  int call_timeout_ms = 30'000;
  int startup_timeout_ms = 10'000;
  int shutdown_timeout_ms = 1'000;

  ResponseGrammar grammar = ResponseGrammar::gdb_console();
};

// Owns the debugger process and its console. Strictly one command in
// flight; concurrent callers queue on the turn lock.
class DebuggerSession {
public:
  static core::Result<std::unique_ptr<DebuggerSession>> create(std::unique_ptr<core::ITextChannel> ch,
                                                               SessionCfg cfg) noexcept;

  // Spawns the debugger and attaches to the remote target.
  static core::Result<std::unique_ptr<DebuggerSession>> start(const LaunchSpec& spec,
                                                              SessionCfg cfg,
                                                              std::stop_token st = {}) noexcept;

  ~DebuggerSession();

  DebuggerSession(const DebuggerSession&) = delete;
  DebuggerSession& operator=(const DebuggerSession&) = delete;

  core::Status attach(std::string_view endpoint, bool extended_remote, std::stop_token st = {});

  core::Result<Response> send(std::string_view command, std::stop_token st = {});
  core::Result<Response> send(std::string_view command, int timeout_ms, std::stop_token st = {});

  core::Result<AddressRange> restore(const std::filesystem::path& file, std::uint64_t address, std::stop_token st = {});
  core::Result<std::uint32_t> call(std::string_view function, std::uint64_t arg0, std::uint64_t arg1, std::stop_token st = {});
  core::Result<std::uint64_t> address_of(std::string_view symbol, std::stop_token st = {});
  core::Status dump_memory(const std::filesystem::path& out, std::uint64_t start, std::uint64_t end, std::stop_token st = {});
  core::Status monitor(std::string_view command, std::stop_token st = {});
  core::Status run_to(std::string_view symbol, std::stop_token st = {});

  // Caps every later command deadline; reaching it reads as cancellation.
  void set_deadline(std::optional<core::Clock::time_point> deadline) noexcept;

  // Disconnects, quits and reaps the debugger. Idempotent.
  void shutdown() noexcept;

  bool running() const noexcept;
  bool attached() const noexcept;
  std::size_t commands_sent() const noexcept;

private:
  DebuggerSession(std::unique_ptr<core::ITextChannel> ch, SessionCfg cfg, ResponseParser parser);

  core::Result<Response> send_locked_(std::string_view command, int timeout_ms, std::stop_token st);
  core::Status checked_(std::string_view command, int timeout_ms, std::stop_token st);

private:
  mutable std::mutex turn_mtx_;

  std::unique_ptr<core::ITextChannel> ch_;
  SessionCfg cfg_;
  ResponseParser parser_;

  std::uint64_t seq_ = 0;
  std::size_t sent_ = 0;
  bool running_ = true;
  bool attached_ = false;
  std::optional<core::Clock::time_point> deadline_;
};

} // namespace gdbflash::gdb
