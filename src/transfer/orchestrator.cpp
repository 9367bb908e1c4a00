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

#include "transfer/orchestrator.hpp"

#include "core/checksum.hpp"
#include "core/lookahead.hpp"
#include "io/binary_image.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gdbflash::transfer {

using core::ErrorKind;
using core::Status;

struct Orchestrator::PreparedChunk {
  io::Chunk chunk;
  std::uint32_t host_sum = 0;
  core::Result<io::StagedFile> staged;
};

TransferSession::TransferSession(TargetParameters params, std::unique_ptr<gdb::DebuggerSession> debugger)
  : params_(std::move(params)), debugger_(std::move(debugger))
{}

void Orchestrator::state_(std::size_t index, ChunkState cs) const {
  spdlog::debug("chunk {}: {}", index, state_name(cs));
  if (hooks_.on_chunk_state) hooks_.on_chunk_state(index, cs);
}

Status Orchestrator::run(TransferSession& s,
                         std::span<const std::byte> image,
                         const io::ChunkStore& store,
                         std::stop_token st) {
  std::size_t current = 0;
  Status result;

  if (!s.debugger_) {
    result = Status::Fail(ErrorKind::Startup, "no debugger session");
  } else {
    try {
      result = run_chunks_(s, image, store, st, current);
    } catch (const std::exception& e) {
      result = Status::Failf(ErrorKind::Io, "internal error: {}", e.what());
    }
  }

  if (s.debugger_) s.debugger_->shutdown();

  if (result.ok) {
    s.state_ = SessionState::Completed;
    spdlog::info("Transfer complete: {} chunk(s), {} byte(s)", s.progress_.chunks_done, s.progress_.bytes_total);
    if (hooks_.on_done) hooks_.on_done();
    return result;
  }

  s.state_ = SessionState::Failed;
  if (s.progress_.chunks_total) s.failed_chunk_ = current;
  s.failure_ = result;

  if (s.failed_chunk_) spdlog::error("Transfer stopped at chunk {}: {}", current, result.describe());
  else spdlog::error("Transfer failed: {}", result.describe());
  if (!result.detail.empty()) spdlog::debug("Last debugger output:\n{}", result.detail);

  if (hooks_.on_error) hooks_.on_error(result.describe());
  return result;
}

Status Orchestrator::run_chunks_(TransferSession& s,
                                 std::span<const std::byte> image,
                                 const io::ChunkStore& store,
                                 std::stop_token st,
                                 std::size_t& current) {
  GDBFLASH_TRY(s.params_.validate());
  GDBFLASH_TRY(policy_.validate());

  auto sr = io::ChunkSequence::split(image, s.params_.chunk_size, s.params_.ram_buffer_size);
  if (!sr) return std::move(sr.st);
  const auto& seq = sr.value;

  s.progress_ = Progress{
    .chunks_total = seq.count(),
    .chunks_done = 0,
    .bytes_total = seq.total_bytes(),
    .bytes_remaining = seq.total_bytes(),
  };

  deadline_.reset();
  if (policy_.session_timeout.count() > 0) {
    deadline_ = core::Clock::now() + policy_.session_timeout;
    s.debugger_->set_deadline(deadline_);
  }

  spdlog::info("Transferring {} byte(s) in {} chunk(s) of {} via RAM {:#x} to flash {:#x}",
               seq.total_bytes(), seq.count(), seq.chunk_size(),
               s.params_.ram_buffer_address, s.params_.flash_base);
  if (hooks_.on_plan) hooks_.on_plan(seq.count(), seq.total_bytes());
  if (hooks_.on_stage) hooks_.on_stage("Transferring");

  // Staging chunk i+1 overlaps with the debugger working on chunk i.
  std::size_t next_stage = 0;
  core::Lookahead<PreparedChunk> ahead(
    [&](std::stop_token pst) -> std::optional<PreparedChunk> {
      if (pst.stop_requested() || next_stage >= seq.count()) return std::nullopt;
      const auto c = seq.at(next_stage++);
      return PreparedChunk{c, core::checksum(c.data), store.stage(c)};
    });

  for (std::size_t expect = 0; expect < seq.count(); ++expect) {
    current = expect;

    if (st.stop_requested()) return Status::Fail(ErrorKind::Cancelled, "transfer cancelled");
    if (deadline_ && core::Clock::now() >= *deadline_)
      return Status::Fail(ErrorKind::Cancelled, "session deadline reached");

    auto p = ahead.next();
    if (!p) return Status::Failf(ErrorKind::Io, "chunk {} was never prepared", expect);
    if (p->chunk.index != expect)
      return Status::Failf(ErrorKind::Io, "chunk order violated: expected {}, got {}", expect, p->chunk.index);

    GDBFLASH_TRY(process_chunk_(s, *p, store, st));
  }

  return Status::Ok();
}

Status Orchestrator::process_chunk_(TransferSession& s, PreparedChunk& p, const io::ChunkStore& store, std::stop_token st) {
  const auto& c = p.chunk;

  io::StagedFile staged;
  Status pending;
  if (p.staged) staged = std::move(p.staged.value);
  else pending = std::move(p.staged.st);

  Status last;
  unsigned attempt = 1;
  for (;; ++attempt) {
    if (attempt > 1) {
      state_(c.index, ChunkState::Retrying);
      spdlog::warn("Chunk {}: attempt {}/{} after {}", c.index, attempt, policy_.max_attempts, last.describe());
      if (hooks_.on_retry) hooks_.on_retry(c.index, attempt, last);
    }

    if (!pending.ok) last = std::exchange(pending, Status::Ok());
    else last = attempt_(s, c, p.host_sum, staged, store, st);

    if (last.ok) break;
    if (!core::retryable(last.kind) || attempt >= policy_.max_attempts) {
      state_(c.index, ChunkState::Failed);
      staged.unstage();
      auto msg = core::retryable(last.kind)
        ? fmt::format("chunk {} failed after {} attempt(s): {}", c.index, attempt, last.msg)
        : fmt::format("chunk {}: {}", c.index, last.msg);
      return Status::Fail(last.kind, std::move(msg), std::move(last.detail));
    }
  }

  staged.unstage();

  auto& pr = s.progress_;
  pr.chunks_done += 1;
  pr.bytes_remaining -= std::min<std::uint64_t>(pr.bytes_remaining, c.size());
  state_(c.index, ChunkState::Advanced);
  spdlog::info("Chunk {}/{} written ({} byte(s) at flash {:#x})",
               c.index + 1, pr.chunks_total, c.size(), s.params_.flash_base + c.offset);

  if (hooks_.on_progress) {
    hooks_.on_progress(ProgressEvent{
      .chunk_index = c.index,
      .chunks_total = pr.chunks_total,
      .bytes_remaining = pr.bytes_remaining,
      .attempts = attempt,
    });
  }
  return Status::Ok();
}

Status Orchestrator::attempt_(TransferSession& s,
                              const io::Chunk& c,
                              std::uint32_t host_sum,
                              io::StagedFile& staged,
                              const io::ChunkStore& store,
                              std::stop_token st) {
  auto& dbg = *s.debugger_;
  const auto& tp = s.params_;

  std::error_code ec;
  if (!staged.staged() || !std::filesystem::exists(staged.path(), ec)) {
    auto r = store.stage(c);
    if (!r) return std::move(r.st);
    staged = std::move(r.value);
  }
  state_(c.index, ChunkState::Staged);

  auto rr = dbg.restore(staged.path(), tp.ram_buffer_address, st);
  if (!rr) return std::move(rr.st);
  if (rr.value.start != tp.ram_buffer_address || rr.value.length() != c.size()) {
    return Status::Failf(ErrorKind::Parse, "restore wrote {:#x}..{:#x}, expected {} byte(s) at {:#x}",
                         rr.value.start, rr.value.end, c.size(), tp.ram_buffer_address);
  }
  state_(c.index, ChunkState::Restored);

  // The debugger has the bytes; a retry stages them again.
  staged.unstage();

  if (policy_.verify_ram) GDBFLASH_TRY(verify_ram_(s, c, store, st));

  auto cr = dbg.call(tp.copy_function, tp.flash_base + c.offset, c.size(), st);
  if (!cr) return std::move(cr.st);
  state_(c.index, ChunkState::CopyInvoked);

  if (cr.value != host_sum) {
    return Status::Failf(ErrorKind::ChecksumMismatch, "target checksum {:#010x} != host checksum {:#010x}",
                         cr.value, host_sum);
  }
  state_(c.index, ChunkState::Verified);
  return Status::Ok();
}

Status Orchestrator::verify_ram_(TransferSession& s, const io::Chunk& c, const io::ChunkStore& store, std::stop_token st) {
  const auto& tp = s.params_;
  io::StagedFile readback(store.dir() / fmt::format("readback_{:05}.bin", c.index), c.index, c.size());

  GDBFLASH_TRY(s.debugger_->dump_memory(readback.path(), tp.ram_buffer_address, tp.ram_buffer_address + c.size(), st));

  auto ir = io::BinaryImage::load(readback.path());
  if (!ir) return std::move(ir.st);

  const auto got = ir.value.bytes();
  if (got.size() != c.size() || !std::equal(got.begin(), got.end(), c.data.begin())) {
    return Status::Failf(ErrorKind::ChecksumMismatch, "RAM read-back differs (checksum {:#010x}, expected {:#010x})",
                         core::checksum(got), core::checksum(c.data));
  }
  spdlog::debug("chunk {}: RAM read-back matches", c.index);
  return Status::Ok();
}

} // namespace gdbflash::transfer
