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
#include <iterator>
#include <limits>
#include <span>

namespace gdbflash::io {

struct Chunk {
  std::size_t index = 0;
  std::uint64_t offset = 0;
  std::span<const std::byte> data{};
  bool is_last = false;

  std::size_t size() const noexcept { return data.size(); }
};

// Ordered, restartable view of an image as fixed-size chunks. Only the
// last chunk may be shorter. Chunks are materialized on demand.
class ChunkSequence {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Chunk;

    iterator() = default;

    Chunk operator*() const noexcept { return seq_->at(idx_); }
    iterator& operator++() noexcept { ++idx_; return *this; }
    iterator operator++(int) noexcept { auto t = *this; ++idx_; return t; }
    bool operator==(const iterator& o) const noexcept { return idx_ == o.idx_; }

  private:
    friend class ChunkSequence;
    iterator(const ChunkSequence* s, std::size_t i) : seq_(s), idx_(i) {}

    const ChunkSequence* seq_ = nullptr;
    std::size_t idx_ = 0;
  };

  // chunk_size must be in (0, max_chunk]; the image must not be empty.
  static core::Result<ChunkSequence> split(std::span<const std::byte> image,
                                           std::size_t chunk_size,
                                           std::size_t max_chunk = std::numeric_limits<std::size_t>::max()) noexcept;

  std::size_t count() const noexcept { return count_; }
  std::size_t chunk_size() const noexcept { return chunk_size_; }
  std::uint64_t total_bytes() const noexcept { return image_.size(); }

  Chunk at(std::size_t index) const noexcept;

  iterator begin() const noexcept { return {this, 0}; }
  iterator end() const noexcept { return {this, count_}; }

private:
  ChunkSequence(std::span<const std::byte> image, std::size_t chunk_size);

  std::span<const std::byte> image_{};
  std::size_t chunk_size_ = 0;
  std::size_t count_ = 0;
};

// Per-run staging directory, removed with everything in it on destruction.
class WorkDir {
public:
  static core::Result<WorkDir> create(const std::filesystem::path& parent) noexcept;

  WorkDir(const WorkDir&) = delete;
  WorkDir& operator=(const WorkDir&) = delete;
  WorkDir(WorkDir&& o) noexcept;
  WorkDir& operator=(WorkDir&& o) noexcept;
  ~WorkDir();

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  explicit WorkDir(std::filesystem::path p) : path_(std::move(p)) {}
  void remove_() noexcept;

  std::filesystem::path path_;
};

// One chunk's bytes on disk. Deleted on unstage() or destruction.
class StagedFile {
public:
  StagedFile() = default;
  StagedFile(std::filesystem::path p, std::size_t index, std::size_t size)
    : path_(std::move(p)), index_(index), size_(size) {}

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;
  StagedFile(StagedFile&& o) noexcept;
  StagedFile& operator=(StagedFile&& o) noexcept;
  ~StagedFile() { unstage(); }

  const std::filesystem::path& path() const noexcept { return path_; }
  std::size_t index() const noexcept { return index_; }
  std::size_t size() const noexcept { return size_; }
  bool staged() const noexcept { return !path_.empty(); }

  // Deletion failure is logged, never escalated.
  void unstage() noexcept;

private:
  std::filesystem::path path_;
  std::size_t index_ = 0;
  std::size_t size_ = 0;
};

class ChunkStore {
public:
  explicit ChunkStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  const std::filesystem::path& dir() const noexcept { return dir_; }
  std::filesystem::path path_for(std::size_t index) const;

  core::Result<StagedFile> stage(const Chunk& c) const noexcept;

private:
  std::filesystem::path dir_;
};

} // namespace gdbflash::io
