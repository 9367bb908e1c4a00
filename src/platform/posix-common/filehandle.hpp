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

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

namespace gdbflash {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  ssize_t read(void* buf, size_t count) const noexcept {
    const ssize_t rc = ::read(fd, buf, count);
    if (rc < 0 && errno != EINTR && errno != EAGAIN) {
      const int e = errno;
      spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  ssize_t write(const void* buf, size_t count) const noexcept {
    const ssize_t rc = ::write(fd, buf, count);
    if (rc < 0 && errno != EINTR && errno != EAGAIN) {
      const int e = errno;
      spdlog::error("write(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int poll(short events, int timeout_ms, short* revents) const noexcept {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno != EINTR) {
      const int e = errno;
      spdlog::error("poll(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    if (revents) *revents = pfd.revents;
    return rc;
  }
};

} // namespace gdbflash

#define do_read(fh, buf, count) ((fh).valid() ? (fh).read(buf, count) : -1)
#define do_write(fh, buf, count) ((fh).valid() ? (fh).write(buf, count) : -1)
#define do_poll(fh, events, timeout_ms, revents) ((fh).valid() ? (fh).poll(events, timeout_ms, revents) : -1)
