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

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>

namespace gdbflash::core {

using Clock = std::chrono::steady_clock;

// Line-oriented duplex text stream to an external process.
class ITextChannel {
 public:
  virtual ~ITextChannel() = default;

  virtual std::string label() const = 0;

  virtual bool alive() const noexcept = 0;

  // Writes `line` followed by '\n'.
  virtual Status write_line(std::string_view line) = 0;

  // Next complete line without its terminator. Fails with Timeout once
  // `deadline` passes, Cancelled when `st` is stopped, Io on EOF.
  virtual Result<std::string> read_line(Clock::time_point deadline, std::stop_token st) = 0;

  // Ends the peer and releases the stream. Safe to call more than once.
  virtual void close() noexcept = 0;
};

} // namespace gdbflash::core
