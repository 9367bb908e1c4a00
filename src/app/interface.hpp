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

#include "transfer/orchestrator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gdbflash::app {

class TransferInterface {
public:
  explicit TransferInterface(bool is_tty_enabled);
  ~TransferInterface();

  TransferInterface(const TransferInterface &) = delete;
  TransferInterface &operator=(const TransferInterface &) = delete;

  bool tty() const noexcept { return tty_; }

  void target(std::string endpoint, std::string elf);
  void stage(std::string stage);

  void plan(std::size_t chunks, std::uint64_t total_bytes);
  void chunk_state(std::size_t index, transfer::ChunkState state);
  void retry(std::size_t index, unsigned attempt, std::string reason);
  void progress(const transfer::ProgressEvent &ev);

  void notice(std::string msg);
  void fail(std::string msg);
  void done(std::string msg);

private:
  struct TermSize {
    int rows = 0;
    int cols = 0;
  };
  struct Clip {
    std::string s;
    std::size_t w = 0;
  };

  void redraw_(bool force);
  TermSize term_size_() const;

  static bool is_tty_();
  static bool colors_enabled_();
  static bool utf8_enabled_();

  static std::string bytes_h_(std::uint64_t b);
  static std::string rate_h_(double bytes_per_sec);
  static std::string eta_h_(std::optional<std::chrono::seconds> eta);

  char spinner_() const;

  Clip clip_(std::string_view s, std::size_t max_cols) const;
  std::string bar_(double frac, std::size_t width_cols) const;

  bool tty_ = false, color_ = false, utf8_ = false;

  mutable std::mutex mtx_;

  std::string endpoint_, elf_, stage_;

  std::size_t chunks_total_ = 0, chunks_done_ = 0;
  std::size_t active_chunk_ = static_cast<std::size_t>(-1);
  std::optional<transfer::ChunkState> active_state_;
  unsigned retries_ = 0;

  std::uint64_t bytes_done_ = 0, bytes_total_ = 0;

  std::deque<std::string> events_;
  std::string notice_line_, status_line_;
  bool fatal_ = false;

  std::chrono::steady_clock::time_point start_{}, last_rate_ts_{},
      last_redraw_{};
  std::uint64_t last_rate_bytes_ = 0;
  double ema_rate_bps_ = 0.0;
};

} // namespace gdbflash::app
