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

#include "gdb/session.hpp"

#include "core/str.hpp"
#include "platform/posix-common/subprocess.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gdbflash::gdb {

using core::ErrorKind;

namespace {

constexpr std::string_view kSentinelOpen = "<<gdbflash:";
constexpr std::string_view kSentinelClose = ">>";

// Splits `line` at a completion marker. Returns the marker's sequence
// number and leaves any output that preceded it in `before`.
std::optional<std::uint64_t> find_sentinel(std::string_view line, std::string_view& before) {
  const auto open = line.find(kSentinelOpen);
  if (open == std::string_view::npos) return std::nullopt;

  const auto digits = line.substr(open + kSentinelOpen.size());
  const auto close = digits.find(kSentinelClose);
  if (close == std::string_view::npos) return std::nullopt;

  std::uint64_t seq = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + close, seq, 10);
  if (ec != std::errc{} || ptr != digits.data() + close) return std::nullopt;

  before = core::trim_ws(line.substr(0, open));
  return seq;
}

} // namespace

DebuggerSession::DebuggerSession(std::unique_ptr<core::ITextChannel> ch, SessionCfg cfg, ResponseParser parser)
  : ch_(std::move(ch)), cfg_(std::move(cfg)), parser_(std::move(parser))
{}

DebuggerSession::~DebuggerSession() { shutdown(); }

core::Result<std::unique_ptr<DebuggerSession>> DebuggerSession::create(std::unique_ptr<core::ITextChannel> ch,
                                                                       SessionCfg cfg) noexcept
{
  using R = core::Result<std::unique_ptr<DebuggerSession>>;
  if (!ch) return R::Fail(ErrorKind::Startup, "no debugger channel");

  auto pr = ResponseParser::compile(cfg.grammar);
  if (!pr) return R::Fail(std::move(pr.st));

  return R::Ok(std::unique_ptr<DebuggerSession>(
    new DebuggerSession(std::move(ch), std::move(cfg), std::move(pr.value))));
}

core::Result<std::unique_ptr<DebuggerSession>> DebuggerSession::start(const LaunchSpec& spec,
                                                                      SessionCfg cfg,
                                                                      std::stop_token st) noexcept
{
  using R = core::Result<std::unique_ptr<DebuggerSession>>;

  std::vector<std::string> args{"-q"};
  args.insert(args.end(), spec.extra_args.begin(), spec.extra_args.end());
  args.push_back(spec.executable.string());

  spdlog::info("Starting {} with {}", spec.gdb_path, spec.executable.string());
  auto pr = posix_common::Subprocess::spawn(spec.gdb_path, std::move(args));
  if (!pr) return R::Fail(ErrorKind::Startup, std::move(pr.st.msg));

  auto sr = create(std::move(pr.value), std::move(cfg));
  if (!sr) return sr;

  auto ast = sr.value->attach(spec.endpoint, spec.extended_remote, st);
  if (!ast.ok) {
    sr.value->shutdown();
    return R::Fail(std::move(ast));
  }
  return sr;
}

bool DebuggerSession::running() const noexcept {
  std::lock_guard lk(turn_mtx_);
  return running_;
}

bool DebuggerSession::attached() const noexcept {
  std::lock_guard lk(turn_mtx_);
  return attached_;
}

std::size_t DebuggerSession::commands_sent() const noexcept {
  std::lock_guard lk(turn_mtx_);
  return sent_;
}

void DebuggerSession::set_deadline(std::optional<core::Clock::time_point> deadline) noexcept {
  std::lock_guard lk(turn_mtx_);
  deadline_ = deadline;
}

core::Result<Response> DebuggerSession::send(std::string_view command, std::stop_token st) {
  return send(command, cfg_.response_timeout_ms, std::move(st));
}

core::Result<Response> DebuggerSession::send(std::string_view command, int timeout_ms, std::stop_token st) {
  std::lock_guard lk(turn_mtx_);
  return send_locked_(command, timeout_ms, std::move(st));
}

core::Result<Response> DebuggerSession::send_locked_(std::string_view command, int timeout_ms, std::stop_token st) {
  using R = core::Result<Response>;

  if (!running_) return R::Failf(ErrorKind::Io, "'{}': debugger session is shut down", command);
  if (st.stop_requested()) return R::Failf(ErrorKind::Cancelled, "'{}': cancelled before sending", command);

  const std::uint64_t seq = ++seq_;
  const auto echo = fmt::format("echo {}{}{}\\n", kSentinelOpen, seq, kSentinelClose);

  spdlog::debug("gdb <- {}", command);
  auto wst = ch_->write_line(command);
  if (wst.ok) wst = ch_->write_line(echo);
  if (!wst.ok) return R::Fail(std::move(wst));
  ++sent_;

  auto deadline = core::Clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 1));
  bool capped = false;
  if (deadline_ && *deadline_ < deadline) {
    deadline = *deadline_;
    capped = true;
  }

  Response resp;
  resp.command = std::string(command);

  for (;;) {
    auto lr = ch_->read_line(deadline, st);
    if (!lr) {
      auto s = std::move(lr.st);
      std::string partial = resp.text();
      if (!s.detail.empty()) {
        if (!partial.empty()) partial.push_back('\n');
        partial += s.detail;
      }

      switch (s.kind) {
        case ErrorKind::Timeout:
          if (capped) return R::Fail(ErrorKind::Cancelled, fmt::format("'{}': session deadline reached", command), std::move(partial));
          spdlog::debug("gdb: '{}' timed out after {} ms, partial output: {}", command, timeout_ms, partial.empty() ? "<none>" : partial);
          return R::Fail(ErrorKind::Timeout, fmt::format("'{}': no complete response within {} ms", command, timeout_ms), std::move(partial));
        case ErrorKind::Cancelled:
          return R::Fail(ErrorKind::Cancelled, fmt::format("'{}': cancelled", command), std::move(partial));
        default:
          return R::Fail(s.kind, fmt::format("'{}': {}", command, s.msg), std::move(partial));
      }
    }

    const std::string_view line = parser_.strip_prompt(lr.value);

    std::string_view before;
    if (const auto got = find_sentinel(line, before)) {
      if (!before.empty()) {
        spdlog::debug("gdb -> {}", before);
        resp.lines.emplace_back(before);
      }
      if (*got == seq) break;

      // Output of an earlier command that timed out; not ours.
      spdlog::debug("gdb: discarding {} stale line(s) ending at marker {}", resp.lines.size(), *got);
      resp.lines.clear();
      continue;
    }

    if (line.empty()) continue;
    spdlog::debug("gdb -> {}", line);
    resp.lines.emplace_back(line);
  }

  return R::Ok(std::move(resp));
}

core::Status DebuggerSession::checked_(std::string_view command, int timeout_ms, std::stop_token st) {
  auto r = send(command, timeout_ms, std::move(st));
  if (!r) return r.st;
  if (auto e = parser_.error_line(r.value)) {
    return core::Status::Fail(ErrorKind::Command, fmt::format("'{}' failed: {}", command, *e), r.value.text());
  }
  return core::Status::Ok();
}

core::Status DebuggerSession::attach(std::string_view endpoint, bool extended_remote, std::stop_token st) {
  auto as_startup = [](core::Status s) {
    if (s.kind != ErrorKind::Cancelled) s.kind = ErrorKind::Startup;
    return s;
  };

  // The first turn also collects whatever the debugger printed while
  // loading the symbol file.
  for (const auto cmd : {"set confirm off", "set pagination off", "set height 0", "set width 0"}) {
    auto s = checked_(cmd, cfg_.startup_timeout_ms, st);
    if (!s.ok) return as_startup(std::move(s));
  }

  const auto cmd = fmt::format("{} {}", extended_remote ? "target extended-remote" : "target remote", endpoint);
  auto r = send(cmd, cfg_.startup_timeout_ms, st);
  if (!r) return as_startup(std::move(r.st));

  if (!parser_.connected(r.value)) {
    if (auto e = parser_.error_line(r.value)) {
      return core::Status::Fail(ErrorKind::Startup, fmt::format("Cannot attach to {}: {}", endpoint, *e), r.value.text());
    }
    return core::Status::Fail(ErrorKind::Startup, fmt::format("Cannot attach to {}: unexpected response", endpoint), r.value.text());
  }

  {
    std::lock_guard lk(turn_mtx_);
    attached_ = true;
  }
  spdlog::info("Attached to {} ({})", endpoint, ch_->label());
  return core::Status::Ok();
}

core::Result<AddressRange> DebuggerSession::restore(const std::filesystem::path& file, std::uint64_t address, std::stop_token st) {
  auto r = send(fmt::format("restore {} binary {:#x}", file.string(), address), cfg_.response_timeout_ms, std::move(st));
  if (!r) return core::Result<AddressRange>::Fail(std::move(r.st));
  return parser_.address_range(r.value);
}

core::Result<std::uint32_t> DebuggerSession::call(std::string_view function, std::uint64_t arg0, std::uint64_t arg1, std::stop_token st) {
  auto r = send(fmt::format("call {}({:#x}, {})", function, arg0, arg1), cfg_.call_timeout_ms, std::move(st));
  if (!r) return core::Result<std::uint32_t>::Fail(std::move(r.st));
  return parser_.numeric_result(r.value);
}

core::Result<std::uint64_t> DebuggerSession::address_of(std::string_view symbol, std::stop_token st) {
  auto r = send(fmt::format("print/x &{}", symbol), cfg_.response_timeout_ms, std::move(st));
  if (!r) return core::Result<std::uint64_t>::Fail(std::move(r.st));
  return parser_.address_value(r.value);
}

core::Status DebuggerSession::dump_memory(const std::filesystem::path& out, std::uint64_t start, std::uint64_t end, std::stop_token st) {
  return checked_(fmt::format("dump binary memory {} {:#x} {:#x}", out.string(), start, end), cfg_.response_timeout_ms, std::move(st));
}

core::Status DebuggerSession::monitor(std::string_view command, std::stop_token st) {
  return checked_(fmt::format("monitor {}", command), cfg_.response_timeout_ms, std::move(st));
}

core::Status DebuggerSession::run_to(std::string_view symbol, std::stop_token st) {
  GDBFLASH_TRY(checked_(fmt::format("break {}", symbol), cfg_.response_timeout_ms, st));
  return checked_("continue", cfg_.call_timeout_ms, std::move(st));
}

void DebuggerSession::shutdown() noexcept {
  std::lock_guard lk(turn_mtx_);
  if (!running_) return;

  if (attached_ && ch_->alive()) {
    auto r = send_locked_("disconnect", cfg_.shutdown_timeout_ms, {});
    if (!r) spdlog::debug("gdb: disconnect: {}", r.st.describe());
    attached_ = false;
  }

  if (ch_->alive()) {
    spdlog::debug("gdb <- quit");
    auto wst = ch_->write_line("quit");
    if (!wst.ok) spdlog::debug("gdb: quit: {}", wst.describe());
  }

  ch_->close();
  running_ = false;
  spdlog::debug("Debugger session closed ({} commands)", sent_);
}

} // namespace gdbflash::gdb
