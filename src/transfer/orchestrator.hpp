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
#include "gdb/session.hpp"
#include "io/chunk_store.hpp"
#include "transfer/target_params.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace gdbflash::transfer {

enum class ChunkState { Staged, Restored, CopyInvoked, Verified, Advanced, Retrying, Failed };

constexpr std::string_view state_name(ChunkState s) noexcept {
  switch (s) {
    case ChunkState::Staged: return "staged";
    case ChunkState::Restored: return "restored";
    case ChunkState::CopyInvoked: return "copy-invoked";
    case ChunkState::Verified: return "verified";
    case ChunkState::Advanced: return "advanced";
    case ChunkState::Retrying: return "retrying";
    case ChunkState::Failed: return "failed";
  }
  return "?";
}

enum class SessionState { Running, Completed, Failed };

struct Progress {
  std::size_t chunks_total = 0;
  std::size_t chunks_done = 0;
  std::uint64_t bytes_total = 0;
  std::uint64_t bytes_remaining = 0;
};

// Emitted after every advanced chunk.
struct ProgressEvent {
  std::size_t chunk_index = 0;
  std::size_t chunks_total = 0;
  std::uint64_t bytes_remaining = 0;
  // Attempts the chunk needed; 1 when it went through first time.
  unsigned attempts = 0;
};

struct Hooks {
  std::function<void(const std::string&)> on_stage;
  std::function<void(std::size_t, std::uint64_t)> on_plan;
  std::function<void(std::size_t, ChunkState)> on_chunk_state;
  std::function<void(std::size_t, unsigned, const core::Status&)> on_retry;
  std::function<void(const ProgressEvent&)> on_progress;
  std::function<void(const std::string&)> on_error;
  std::function<void()> on_done;
};

// One end-to-end run. Owns the debugger; it is shut down once the run
// reaches a terminal state, and again (no-op) on destruction.
class TransferSession {
public:
  TransferSession(TargetParameters params, std::unique_ptr<gdb::DebuggerSession> debugger);

  TransferSession(const TransferSession&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;

  const TargetParameters& params() const noexcept { return params_; }

  const Progress& progress() const noexcept { return progress_; }
  SessionState state() const noexcept { return state_; }
  const core::Status& failure() const noexcept { return failure_; }
  std::optional<std::size_t> failed_chunk() const noexcept { return failed_chunk_; }

private:
  friend class Orchestrator;

  TargetParameters params_;
  std::unique_ptr<gdb::DebuggerSession> debugger_;

  Progress progress_{};
  SessionState state_ = SessionState::Running;
  core::Status failure_{};
  std::optional<std::size_t> failed_chunk_;
};

class Orchestrator {
public:
  explicit Orchestrator(TransferPolicy policy, Hooks hooks = {})
    : policy_(policy), hooks_(std::move(hooks)) {}

  // Transfers `image` chunk by chunk, staging files through `store`.
  // Ends Completed or Failed; the debugger is shut down either way.
  core::Status run(TransferSession& s,
                   std::span<const std::byte> image,
                   const io::ChunkStore& store,
                   std::stop_token st = {});

private:
  struct PreparedChunk;

  core::Status run_chunks_(TransferSession& s,
                           std::span<const std::byte> image,
                           const io::ChunkStore& store,
                           std::stop_token st,
                           std::size_t& current);

  core::Status process_chunk_(TransferSession& s, PreparedChunk& p, const io::ChunkStore& store, std::stop_token st);

  core::Status attempt_(TransferSession& s,
                        const io::Chunk& c,
                        std::uint32_t host_sum,
                        io::StagedFile& staged,
                        const io::ChunkStore& store,
                        std::stop_token st);

  core::Status verify_ram_(TransferSession& s, const io::Chunk& c, const io::ChunkStore& store, std::stop_token st);

  void state_(std::size_t index, ChunkState cs) const;

  TransferPolicy policy_;
  Hooks hooks_;
  std::optional<core::Clock::time_point> deadline_;
};

} // namespace gdbflash::transfer
