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

#include <cstddef>
#include <cstdint>
#include <span>

namespace gdbflash::core {

// Additive byte sum in a 32-bit register, wrapping modulo 2^32.
// Matches the accumulation done by the target's copy routine:
//
//   uint32_t sum = 0;
//   for (uint32_t i = 0; i < len; ++i) sum += ram_buf[i];
class Checksum {
public:
  constexpr Checksum() noexcept = default;
  constexpr explicit Checksum(std::uint32_t seed) noexcept : acc_(seed) {}

  constexpr Checksum& update(std::span<const std::byte> data) noexcept {
    for (const auto b : data) acc_ += static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(b));
    return *this;
  }

  constexpr Checksum& update(std::span<const std::uint8_t> data) noexcept {
    for (const auto b : data) acc_ += static_cast<std::uint32_t>(b);
    return *this;
  }

  constexpr std::uint32_t value() const noexcept { return acc_; }

private:
  std::uint32_t acc_ = 0;
};

constexpr std::uint32_t checksum(std::span<const std::byte> data) noexcept {
  return Checksum{}.update(data).value();
}

constexpr std::uint32_t checksum(std::span<const std::uint8_t> data) noexcept {
  return Checksum{}.update(data).value();
}

} // namespace gdbflash::core
