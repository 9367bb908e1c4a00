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

#include "io/binary_image.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace gdbflash::io {

using core::ErrorKind;

core::Result<BinaryImage> BinaryImage::load(const std::filesystem::path& p) noexcept {
  std::error_code ec;
  const auto sz = std::filesystem::file_size(p, ec);
  if (ec) return core::Result<BinaryImage>::Failf(ErrorKind::Io, "Cannot stat file: {} ({})", p.string(), ec.message());
  if (static_cast<std::uint64_t>(sz) > kMaxBytes) return core::Result<BinaryImage>::Failf(ErrorKind::Config, "File too large: {}", p.string());

  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) return core::Result<BinaryImage>::Failf(ErrorKind::Io, "Cannot open file: {}", p.string());

  std::vector<std::byte> buf(static_cast<std::size_t>(sz));
  if (!buf.empty()) {
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (!in.good()) return core::Result<BinaryImage>::Failf(ErrorKind::Io, "Read failed: {}", p.string());
  }

  spdlog::debug("Loaded {} ({} bytes)", p.string(), buf.size());
  return core::Result<BinaryImage>::Ok(BinaryImage(std::move(buf), p.string()));
}

BinaryImage BinaryImage::from_bytes(std::vector<std::byte> bytes, std::string name) {
  return BinaryImage(std::move(bytes), std::move(name));
}

} // namespace gdbflash::io
