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

#include "io/chunk_store.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

namespace gdbflash::io {

using core::ErrorKind;

ChunkSequence::ChunkSequence(std::span<const std::byte> image, std::size_t chunk_size)
  : image_(image)
  , chunk_size_(chunk_size)
  , count_(image.size() / chunk_size + (image.size() % chunk_size != 0))
{}

core::Result<ChunkSequence> ChunkSequence::split(std::span<const std::byte> image,
                                                 std::size_t chunk_size,
                                                 std::size_t max_chunk) noexcept
{
  if (chunk_size == 0) return core::Result<ChunkSequence>::Fail(ErrorKind::Config, "chunk size must be > 0");
  if (chunk_size > max_chunk) {
    return core::Result<ChunkSequence>::Failf(ErrorKind::Config,
      "chunk size {} exceeds RAM buffer size {}", chunk_size, max_chunk);
  }
  if (image.empty()) return core::Result<ChunkSequence>::Fail(ErrorKind::Config, "image is empty, nothing to transfer");

  return core::Result<ChunkSequence>::Ok(ChunkSequence(image, chunk_size));
}

Chunk ChunkSequence::at(std::size_t index) const noexcept {
  if (index >= count_) return {};
  const std::size_t off = index * chunk_size_;
  const std::size_t n = std::min(chunk_size_, image_.size() - off);
  return Chunk{.index = index, .offset = off, .data = image_.subspan(off, n), .is_last = index + 1 == count_};
}

/* --- WorkDir --- */

core::Result<WorkDir> WorkDir::create(const std::filesystem::path& parent) noexcept {
  static std::atomic<unsigned> seq{0};

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) return core::Result<WorkDir>::Failf(ErrorKind::Io, "Cannot create {}: {}", parent.string(), ec.message());

  for (int attempt = 0; attempt < 16; ++attempt) {
    auto p = parent / fmt::format("gdbflash-{}-{}", ::getpid(), seq.fetch_add(1));
    if (std::filesystem::create_directory(p, ec)) {
      spdlog::debug("Staging directory: {}", p.string());
      return core::Result<WorkDir>::Ok(WorkDir(std::move(p)));
    }
    if (ec) return core::Result<WorkDir>::Failf(ErrorKind::Io, "Cannot create {}: {}", p.string(), ec.message());
  }
  return core::Result<WorkDir>::Failf(ErrorKind::Io, "Cannot create a unique staging directory under {}", parent.string());
}

WorkDir::WorkDir(WorkDir&& o) noexcept : path_(std::move(o.path_)) { o.path_.clear(); }

WorkDir& WorkDir::operator=(WorkDir&& o) noexcept {
  if (this == &o) return *this;
  remove_();
  path_ = std::move(o.path_);
  o.path_.clear();
  return *this;
}

WorkDir::~WorkDir() { remove_(); }

void WorkDir::remove_() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) spdlog::warn("Cannot remove staging directory {}: {}", path_.string(), ec.message());
  else spdlog::debug("Removed staging directory {}", path_.string());
  path_.clear();
}

/* --- StagedFile --- */

StagedFile::StagedFile(StagedFile&& o) noexcept
  : path_(std::move(o.path_)), index_(o.index_), size_(o.size_)
{
  o.path_.clear();
}

StagedFile& StagedFile::operator=(StagedFile&& o) noexcept {
  if (this == &o) return *this;
  unstage();
  path_ = std::move(o.path_);
  index_ = o.index_;
  size_ = o.size_;
  o.path_.clear();
  return *this;
}

void StagedFile::unstage() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  if (!std::filesystem::remove(path_, ec) && ec) {
    spdlog::warn("Cannot delete staged chunk {}: {}", path_.string(), ec.message());
  } else {
    spdlog::debug("Unstaged chunk {} ({})", index_, path_.string());
  }
  path_.clear();
}

/* --- ChunkStore --- */

std::filesystem::path ChunkStore::path_for(std::size_t index) const {
  return dir_ / fmt::format("chunk_{:05}.bin", index);
}

core::Result<StagedFile> ChunkStore::stage(const Chunk& c) const noexcept {
  auto p = path_for(c.index);

  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) return core::Result<StagedFile>::Failf(ErrorKind::Io, "Cannot create staged chunk: {}", p.string());

  out.write(reinterpret_cast<const char*>(c.data.data()), static_cast<std::streamsize>(c.data.size()));
  out.flush();
  if (!out.good()) {
    out.close();
    std::error_code ec;
    (void)std::filesystem::remove(p, ec);
    return core::Result<StagedFile>::Failf(ErrorKind::Io, "Write failed for staged chunk: {}", p.string());
  }
  out.close();
  if (out.fail()) return core::Result<StagedFile>::Failf(ErrorKind::Io, "Close failed for staged chunk: {}", p.string());

  spdlog::debug("Staged chunk {} ({} bytes) -> {}", c.index, c.size(), p.string());
  return core::Result<StagedFile>::Ok(StagedFile(std::move(p), c.index, c.size()));
}

} // namespace gdbflash::io
