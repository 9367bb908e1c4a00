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

#include "app/run.hpp"

#include "app/interface.hpp"

#include "core/str.hpp"
#include "gdb/session.hpp"
#include "io/binary_image.hpp"
#include "io/chunk_store.hpp"
#include "platform/posix-common/signal_watcher.hpp"
#include "transfer/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gdbflash::app {

using core::ErrorKind;

RunResult result_for(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::None: return RunResult::Success;
    case ErrorKind::Config: return RunResult::InvalidUsage;
    case ErrorKind::Startup: return RunResult::StartupFailed;
    case ErrorKind::Cancelled: return RunResult::Cancelled;
    default: return RunResult::TransferFailed;
  }
}

namespace {

// Raises the log threshold while the full-screen display owns the terminal.
class LevelGuard {
public:
  explicit LevelGuard(bool active) : old_(spdlog::get_level()), active_(active) {
    if (active_ && old_ < spdlog::level::warn) spdlog::set_level(spdlog::level::warn);
  }
  ~LevelGuard() { if (active_) spdlog::set_level(old_); }

  LevelGuard(const LevelGuard&) = delete;
  LevelGuard& operator=(const LevelGuard&) = delete;

private:
  spdlog::level::level_enum old_;
  bool active_;
};

core::Result<std::filesystem::path> staging_parent(const Options& opt) {
  using R = core::Result<std::filesystem::path>;
  if (opt.workdir) return R::Ok(*opt.workdir);

  std::error_code ec;
  auto p = std::filesystem::temp_directory_path(ec);
  if (ec) return R::Failf(ErrorKind::Config, "No temporary directory: {} (use --workdir)", ec.message());
  if (core::contains_ws(p.string()))
    return R::Failf(ErrorKind::Config, "Temporary directory {} contains whitespace (use --workdir)", p.string());
  return R::Ok(std::move(p));
}

// Target preparation between attach and the first chunk.
core::Status prepare_target(gdb::DebuggerSession& dbg, const Options& opt, std::stop_token st) {
  if (opt.reset_halt) {
    GDBFLASH_TRY(dbg.monitor("reset", st));
    GDBFLASH_TRY(dbg.monitor("halt", st));
  }
  if (opt.run_to) {
    spdlog::info("Running to {}", *opt.run_to);
    GDBFLASH_TRY(dbg.run_to(*opt.run_to, st));
  }
  return core::Status::Ok();
}

} // namespace

RunResult run(const Options& opt) {
  auto ir = io::BinaryImage::load(opt.bin);
  if (!ir) { spdlog::error("{}", ir.st.describe()); return result_for(ir.st.kind); }
  const auto image = std::move(ir.value);
  spdlog::info("Loaded {} ({} bytes)", image.name(), image.size());

  auto pr = staging_parent(opt);
  if (!pr) { spdlog::error("{}", pr.st.describe()); return result_for(pr.st.kind); }

  auto wr = io::WorkDir::create(pr.value);
  if (!wr) { spdlog::error("{}", wr.st.describe()); return result_for(wr.st.kind); }
  const auto workdir = std::move(wr.value);
  const io::ChunkStore store(workdir.path());

  TransferInterface ui(!opt.verbose);
  LevelGuard quiet_while_drawing(ui.tty());
  ui.target(opt.remote, opt.elf.string());

  // Started before any thread so every later thread inherits the blocked mask.
  std::stop_source stop;
  auto wr_sig = posix_common::SignalWatcher::watch(stop, [&](int signo, unsigned count) {
    const char* sig = posix_common::SignalWatcher::name(signo);
    if (count == 1) ui.notice(fmt::format("{}: cancelling after the current command", sig));
    else ui.notice(fmt::format("{} received {} times, still shutting down the debugger", sig, count));
  });
  if (!wr_sig) spdlog::warn("{}; interrupting will not shut the debugger down cleanly", wr_sig.st.describe());

  auto fail = [&](const core::Status& s) {
    ui.fail(s.describe());
    if (!s.detail.empty()) spdlog::debug("Debugger output:\n{}", s.detail);
    return result_for(s.kind);
  };

  gdb::SessionCfg cfg;
  cfg.response_timeout_ms = opt.timeout_ms;
  cfg.call_timeout_ms = opt.call_timeout_ms;

  gdb::LaunchSpec spec;
  spec.gdb_path = opt.gdb;
  spec.executable = opt.elf;
  spec.endpoint = opt.remote;
  spec.extended_remote = opt.extended_remote;

  ui.stage("Starting debugger");
  auto sr = gdb::DebuggerSession::start(spec, std::move(cfg), stop.get_token());
  if (!sr) return fail(sr.st);
  auto dbg = std::move(sr.value);

  ui.stage("Preparing target");
  if (auto st = prepare_target(*dbg, opt, stop.get_token()); !st.ok) return fail(st);

  std::uint64_t ram_address = 0;
  if (opt.ram_buffer_address) {
    ram_address = *opt.ram_buffer_address;
  } else {
    auto ar = dbg->address_of(*opt.ram_buffer_symbol, stop.get_token());
    if (!ar) {
      // An unresolvable symbol is a setup problem, not a transfer one.
      auto s = std::move(ar.st);
      if (s.kind != ErrorKind::Cancelled) s.kind = ErrorKind::Config;
      s.msg = fmt::format("Cannot resolve RAM buffer symbol '{}': {}", *opt.ram_buffer_symbol, s.msg);
      return fail(s);
    }
    ram_address = ar.value;
    spdlog::info("RAM buffer {} at {:#x}", *opt.ram_buffer_symbol, ram_address);
  }

  transfer::TargetParameters params{
    .ram_buffer_address = ram_address,
    .ram_buffer_size = static_cast<std::size_t>(opt.ram_size),
    .flash_base = opt.flash_base,
    .copy_function = opt.copy_fn,
    .chunk_size = static_cast<std::size_t>(opt.chunk_size),
  };

  transfer::TransferPolicy policy;
  policy.max_attempts = opt.retries;
  policy.session_timeout = std::chrono::seconds(opt.session_timeout_s);
  policy.verify_ram = opt.verify_ram;

  transfer::Hooks hooks;
  hooks.on_stage       = [&](const std::string& s) { ui.stage(s); };
  hooks.on_plan        = [&](std::size_t n, std::uint64_t bytes) { ui.plan(n, bytes); };
  hooks.on_chunk_state = [&](std::size_t i, transfer::ChunkState cs) { ui.chunk_state(i, cs); };
  hooks.on_retry       = [&](std::size_t i, unsigned attempt, const core::Status& why) { ui.retry(i, attempt, why.describe()); };
  hooks.on_progress    = [&](const transfer::ProgressEvent& ev) { ui.progress(ev); };
  hooks.on_error       = [&](const std::string& msg) { ui.fail(msg); };
  hooks.on_done        = [&] { ui.done("DONE"); };

  transfer::TransferSession session(std::move(params), std::move(dbg));
  transfer::Orchestrator orchestrator(policy, std::move(hooks));

  auto st = orchestrator.run(session, image.bytes(), store, stop.get_token());
  return result_for(st.kind);
}

} // namespace gdbflash::app
