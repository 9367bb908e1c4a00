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
#include "core/str.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gdbflash::transfer {

// Fixed for the whole session.
struct TargetParameters {
  std::uint64_t ram_buffer_address = 0;
  std::size_t ram_buffer_size = 0;
  std::uint64_t flash_base = 0;
  std::string copy_function;
  std::size_t chunk_size = 0;

  core::Status validate() const {
    using core::ErrorKind;
    if (!ram_buffer_size) return core::Status::Fail(ErrorKind::Config, "RAM buffer size must be > 0");
    if (!chunk_size) return core::Status::Fail(ErrorKind::Config, "Chunk size must be > 0");
    if (chunk_size > ram_buffer_size)
      return core::Status::Failf(ErrorKind::Config, "Chunk size {} exceeds RAM buffer size {}", chunk_size, ram_buffer_size);
    if (ram_buffer_address > UINT64_MAX - ram_buffer_size)
      return core::Status::Failf(ErrorKind::Config, "RAM buffer {:#x}+{} wraps the address space", ram_buffer_address, ram_buffer_size);
    if (!core::is_c_identifier(copy_function))
      return core::Status::Failf(ErrorKind::Config, "Invalid copy function symbol: '{}'", copy_function);
    return core::Status::Ok();
  }
};

struct TransferPolicy {
  unsigned max_attempts = 3;
  // Zero means no session deadline.
  std::chrono::seconds session_timeout{0};
  // Read the RAM buffer back after every restore.
  bool verify_ram = false;

  core::Status validate() const {
    if (!max_attempts) return core::Status::Fail(core::ErrorKind::Config, "Attempt limit must be >= 1");
    if (session_timeout.count() < 0) return core::Status::Fail(core::ErrorKind::Config, "Session timeout must be >= 0");
    return core::Status::Ok();
  }
};

} // namespace gdbflash::transfer
