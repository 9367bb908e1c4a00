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

#include <fmt/format.h>

#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gdbflash::core {

enum class ErrorKind : std::uint8_t {
  None,
  Config,
  Startup,
  Io,
  Timeout,
  Parse,
  Command,
  ChecksumMismatch,
  Cancelled,
};

constexpr std::string_view kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None: return "ok";
    case ErrorKind::Config: return "configuration error";
    case ErrorKind::Startup: return "startup error";
    case ErrorKind::Io: return "I/O error";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Parse: return "parse error";
    case ErrorKind::Command: return "debugger command failed";
    case ErrorKind::ChecksumMismatch: return "checksum mismatch";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

// Kinds worth another attempt with the same chunk.
constexpr bool retryable(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Io:
    case ErrorKind::Timeout:
    case ErrorKind::Parse:
    case ErrorKind::Command:
    case ErrorKind::ChecksumMismatch:
      return true;
    default:
      return false;
  }
}

struct Status {
  bool ok = true;
  ErrorKind kind = ErrorKind::None;
  std::string msg;
  // Extra context, e.g. the partial debugger output collected before a timeout.
  std::string detail;

  Status() = default;
  Status(ErrorKind kind_, std::string msg_, std::string detail_ = {})
    : ok(kind_ == ErrorKind::None), kind(kind_), msg(std::move(msg_)), detail(std::move(detail_)) {}

  static Status Ok() { return {}; }

  static Status Fail(ErrorKind kind, std::string msg, std::string detail = {}) {
    return Status(kind, std::move(msg), std::move(detail));
  }

  template <class... Args>
  static Status Failf(ErrorKind kind, fmt::format_string<Args...> f, Args&&... args) {
    return Fail(kind, fmt::format(f, std::forward<Args>(args)...));
  }

  std::string describe() const {
    if (ok) return "ok";
    return fmt::format("{}: {}", kind_name(kind), msg);
  }

  explicit operator bool() const noexcept { return ok; }
};

template <class T>
struct Result {
  // NOTE: default construct = failure-without-value. This avoids requiring T{}.
  Status st{ErrorKind::Io, {}};
  bool has_value = false;

  struct Empty { };
  union {
    Empty empty;
    T value;
  };

  Result() noexcept : empty{} {}

  ~Result() { reset_(); }

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  Result(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>)
    : st(std::move(o.st))
    , has_value(o.has_value)
  {
    if (has_value) {
      ::new (static_cast<void*>(std::addressof(value))) T(std::move(o.value));
      o.reset_();
    } else {
      empty = Empty{};
    }
  }

  Result& operator=(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) {
    if (this == &o) return *this;
    reset_();

    st = std::move(o.st);
    has_value = o.has_value;

    if (has_value) {
      ::new (static_cast<void*>(std::addressof(value))) T(std::move(o.value));
      o.reset_();
    } else {
      empty = Empty{};
    }
    return *this;
  }

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    ::new (static_cast<void*>(std::addressof(r.value))) T(std::move(v));
    r.has_value = true;
    return r;
  }

  static Result Fail(Status s) {
    Result r;
    r.st = std::move(s);
    if (r.st.ok) r.st = Status::Fail(ErrorKind::Io, "internal: Result::Fail with ok status");
    return r;
  }

  static Result Fail(ErrorKind kind, std::string msg, std::string detail = {}) {
    return Fail(Status::Fail(kind, std::move(msg), std::move(detail)));
  }

  template <class... Args>
  static Result Failf(ErrorKind kind, fmt::format_string<Args...> f, Args&&... args) {
    return Fail(kind, fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return st.ok; }

private:
  void reset_() noexcept {
    if (has_value) {
      value.~T();
      has_value = false;
    }
  }
};

} // namespace gdbflash::core

#define GDBFLASH_TRY(expr) do { auto _st = (expr); if (!_st.ok) return _st; } while (0)
