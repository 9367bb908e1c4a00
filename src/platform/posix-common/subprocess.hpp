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
#include "filehandle.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace gdbflash::posix_common {

// Child process whose stdin is written line by line and whose stdout and
// stderr are merged into one readable stream.
class Subprocess final : public core::ITextChannel {
public:
  static core::Result<std::unique_ptr<Subprocess>> spawn(std::string program,
                                                         std::vector<std::string> args) noexcept;

  ~Subprocess() override;

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  std::string label() const override;
  bool alive() const noexcept override;

  core::Status write_line(std::string_view line) override;
  core::Result<std::string> read_line(core::Clock::time_point deadline, std::stop_token st) override;

  void close() noexcept override;

  pid_t pid() const noexcept { return pid_; }
  std::optional<int> exit_status() const noexcept { return exit_status_; }

  // Grace period between closing stdin and escalating to SIGTERM, then SIGKILL.
  void set_exit_grace_ms(int ms) noexcept { grace_ms_ = ms; }

private:
  Subprocess(std::string program, pid_t pid, FileHandle in, FileHandle out);

  bool reap_(bool block) const noexcept;
  bool wait_exit_(int ms) const noexcept;
  std::optional<std::string> take_line_();

private:
  std::string program_;
  pid_t pid_ = -1;

  FileHandle in_;
  FileHandle out_;

  std::string buf_;
  bool eof_ = false;
  int grace_ms_ = 1000;

  mutable bool reaped_ = false;
  mutable std::optional<int> exit_status_;
};

} // namespace gdbflash::posix_common
