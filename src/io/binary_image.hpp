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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gdbflash::io {

// Source file contents, read once and never modified.
class BinaryImage {
public:
  static constexpr std::uint64_t kMaxBytes = 1024ull * 1024ull * 1024ull;

  static core::Result<BinaryImage> load(const std::filesystem::path& path) noexcept;
  static BinaryImage from_bytes(std::vector<std::byte> bytes, std::string name = "<memory>");

  std::span<const std::byte> bytes() const noexcept { return data_; }
  std::size_t size() const noexcept { return data_.size(); }
  bool empty() const noexcept { return data_.empty(); }
  const std::string& name() const noexcept { return name_; }

private:
  BinaryImage(std::vector<std::byte> data, std::string name)
    : data_(std::move(data)), name_(std::move(name)) {}

  std::vector<std::byte> data_;
  std::string name_;
};

} // namespace gdbflash::io
