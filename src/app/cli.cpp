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

#include "app/cli.hpp"
#include "app/version.hpp"

#include "core/str.hpp"

#include <cstdint>
#include <limits>
#include <string_view>

namespace gdbflash::app {

using core::ErrorKind;
using R = core::Result<Options>;

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Failf(ErrorKind::Config, "{} requires value", opt);
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

// `size` accepts a k/m suffix; `max` bounds the value.
static core::Result<std::uint64_t> read_number_value(int& i, int argc, char** argv,
                                                     std::string_view a, std::string_view opt,
                                                     bool size, std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<std::uint64_t>::Fail(std::move(vr.st));

  const auto v = size ? core::parse_size(vr.value) : core::parse_u64(vr.value);
  if (!v) return core::Result<std::uint64_t>::Failf(ErrorKind::Config, "{}: not a number: '{}'", opt, vr.value);
  if (*v > max) return core::Result<std::uint64_t>::Failf(ErrorKind::Config, "{}: {} is out of range (max {})", opt, *v, max);
  return core::Result<std::uint64_t>::Ok(*v);
}

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "gdbflash v";
  out += version_string();
  out += "\n\n";

  out += R"(Usage:
  gdbflash --bin <image> --elf <symbols> --ram-buffer <addr|symbol> --ram-size <n>
           --copy-fn <symbol> [options]

Writes <image> into external flash through the target's RAM buffer, one
chunk at a time, by driving a GDB session attached to the target.

Target:
  --bin <file>                 binary image to write (required)
  --elf <file>                 firmware symbol file loaded by gdb (required)
  --ram-buffer <addr|symbol>   RAM staging buffer; a symbol is resolved with print/x & (required)
  --ram-size <n>               RAM staging buffer size (required)
  --flash-base <addr>          flash destination base (default 0)
  --copy-fn <symbol>           target routine fn(flash_offset, len) returning the byte sum (required)
  --chunk-size <n>             bytes per chunk, at most --ram-size (default --ram-size)

Debugger:
  --gdb <exe>                  gdb executable (default arm-none-eabi-gdb)
  --remote <host:port>         gdb server endpoint (default localhost:61234)
  --extended-remote            use target extended-remote
  --reset-halt                 monitor reset + monitor halt after attaching
  --run-to <symbol>            break at <symbol> and continue before the transfer

Policy:
  --retries <n>                attempts per chunk (default 3)
  --timeout-ms <n>             response timeout for ordinary commands (default 5000)
  --call-timeout-ms <n>        response timeout for the copy call (default 30000)
  --session-timeout-s <n>      abort the whole transfer after n seconds (default 0, none)
  --verify-ram                 read the RAM buffer back after each restore
  --workdir <dir>              parent of the staging directory (default system temp)

General:
  --help
  --version
  --verbose, -v                log the full gdb transcript
  --quiet                      warnings and errors only

Numbers accept decimal or 0x hex; sizes also take a k or m suffix.
)";
  return out;
}

R parse_cli(int argc, char** argv) noexcept {
  Options o;

  bool have_bin = false, have_elf = false, have_ram_size = false, have_chunk = false;

#define GDBFLASH_NUMBER(flag, field, size, max)                           \
  if (is_opt(a, flag)) {                                                  \
    auto nr = read_number_value(i, argc, argv, a, flag, size, max);       \
    if (!nr) return R::Fail(std::move(nr.st));                            \
    field = static_cast<decltype(field)>(nr.value);                       \
    continue;                                                             \
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--verbose" || a == "-v") { o.verbose = true; continue; }
    if (a == "--quiet" || a == "-q") { o.quiet = true; continue; }

    if (a == "--extended-remote") { o.extended_remote = true; continue; }
    if (a == "--reset-halt") { o.reset_halt = true; continue; }
    if (a == "--verify-ram") { o.verify_ram = true; continue; }

    if (is_opt(a, "--bin")) {
      auto vr = read_string_value(i, argc, argv, a, "--bin");
      if (!vr) return R::Fail(std::move(vr.st));
      o.bin = std::filesystem::path(std::string(vr.value));
      have_bin = true;
      continue;
    }
    if (is_opt(a, "--elf")) {
      auto vr = read_string_value(i, argc, argv, a, "--elf");
      if (!vr) return R::Fail(std::move(vr.st));
      o.elf = std::filesystem::path(std::string(vr.value));
      have_elf = true;
      continue;
    }
    if (is_opt(a, "--workdir")) {
      auto vr = read_string_value(i, argc, argv, a, "--workdir");
      if (!vr) return R::Fail(std::move(vr.st));
      o.workdir = std::filesystem::path(std::string(vr.value));
      continue;
    }
    if (is_opt(a, "--gdb")) {
      auto vr = read_string_value(i, argc, argv, a, "--gdb");
      if (!vr) return R::Fail(std::move(vr.st));
      o.gdb = std::string(vr.value);
      continue;
    }
    if (is_opt(a, "--remote")) {
      auto vr = read_string_value(i, argc, argv, a, "--remote");
      if (!vr) return R::Fail(std::move(vr.st));
      o.remote = std::string(vr.value);
      continue;
    }
    if (is_opt(a, "--copy-fn")) {
      auto vr = read_string_value(i, argc, argv, a, "--copy-fn");
      if (!vr) return R::Fail(std::move(vr.st));
      o.copy_fn = std::string(vr.value);
      continue;
    }
    if (is_opt(a, "--run-to")) {
      auto vr = read_string_value(i, argc, argv, a, "--run-to");
      if (!vr) return R::Fail(std::move(vr.st));
      o.run_to = std::string(vr.value);
      continue;
    }
    if (is_opt(a, "--ram-buffer")) {
      auto vr = read_string_value(i, argc, argv, a, "--ram-buffer");
      if (!vr) return R::Fail(std::move(vr.st));
      o.ram_buffer_address.reset();
      o.ram_buffer_symbol.reset();
      if (auto v = core::parse_u64(vr.value)) o.ram_buffer_address = *v;
      else o.ram_buffer_symbol = std::string(vr.value);
      continue;
    }

    if (is_opt(a, "--ram-size")) {
      auto nr = read_number_value(i, argc, argv, a, "--ram-size", true);
      if (!nr) return R::Fail(std::move(nr.st));
      o.ram_size = nr.value;
      have_ram_size = true;
      continue;
    }
    if (is_opt(a, "--chunk-size")) {
      auto nr = read_number_value(i, argc, argv, a, "--chunk-size", true);
      if (!nr) return R::Fail(std::move(nr.st));
      o.chunk_size = nr.value;
      have_chunk = true;
      continue;
    }

    GDBFLASH_NUMBER("--flash-base", o.flash_base, false, std::numeric_limits<std::uint64_t>::max())
    GDBFLASH_NUMBER("--retries", o.retries, false, 1000)
    GDBFLASH_NUMBER("--timeout-ms", o.timeout_ms, false, std::numeric_limits<int>::max())
    GDBFLASH_NUMBER("--call-timeout-ms", o.call_timeout_ms, false, std::numeric_limits<int>::max())
    GDBFLASH_NUMBER("--session-timeout-s", o.session_timeout_s, false, 7 * 24 * 3600)

    if (a.starts_with("-")) return R::Failf(ErrorKind::Config, "Unknown option: {}", a);
    return R::Failf(ErrorKind::Config, "Positional arguments are not supported: {}", a);
  }

#undef GDBFLASH_NUMBER

  if (o.help || o.version) return R::Ok(std::move(o));

  if (o.verbose && o.quiet) return R::Fail(ErrorKind::Config, "--verbose cannot be used with --quiet");

  if (!have_bin) return R::Fail(ErrorKind::Config, "--bin is required");
  if (!have_elf) return R::Fail(ErrorKind::Config, "--elf is required");
  if (!o.ram_buffer_address && !o.ram_buffer_symbol) return R::Fail(ErrorKind::Config, "--ram-buffer is required");
  if (!have_ram_size) return R::Fail(ErrorKind::Config, "--ram-size is required");
  if (o.copy_fn.empty()) return R::Fail(ErrorKind::Config, "--copy-fn is required");

  if (o.ram_buffer_symbol && !core::is_c_identifier(*o.ram_buffer_symbol))
    return R::Failf(ErrorKind::Config, "--ram-buffer: '{}' is neither an address nor a symbol", *o.ram_buffer_symbol);
  if (!core::is_c_identifier(o.copy_fn)) return R::Failf(ErrorKind::Config, "--copy-fn: invalid symbol '{}'", o.copy_fn);
  if (o.run_to && !core::is_c_identifier(*o.run_to)) return R::Failf(ErrorKind::Config, "--run-to: invalid symbol '{}'", *o.run_to);

  if (o.remote.empty() || core::contains_ws(o.remote)) return R::Failf(ErrorKind::Config, "--remote: invalid endpoint '{}'", o.remote);

  // gdb's restore/dump take the file name unquoted.
  if (o.workdir && core::contains_ws(o.workdir->string()))
    return R::Failf(ErrorKind::Config, "--workdir must not contain whitespace: '{}'", o.workdir->string());

  if (!o.ram_size) return R::Fail(ErrorKind::Config, "--ram-size must be > 0");
  if (!have_chunk) o.chunk_size = o.ram_size;
  if (!o.chunk_size) return R::Fail(ErrorKind::Config, "--chunk-size must be > 0");
  if (o.chunk_size > o.ram_size)
    return R::Failf(ErrorKind::Config, "--chunk-size {} exceeds --ram-size {}", o.chunk_size, o.ram_size);
  if (o.ram_buffer_address && *o.ram_buffer_address > UINT64_MAX - o.ram_size)
    return R::Failf(ErrorKind::Config, "--ram-buffer {:#x} with --ram-size {} wraps the address space",
                    *o.ram_buffer_address, o.ram_size);

  if (!o.retries) return R::Fail(ErrorKind::Config, "--retries must be >= 1");
  if (o.timeout_ms <= 0) return R::Fail(ErrorKind::Config, "--timeout-ms must be > 0");
  if (o.call_timeout_ms <= 0) return R::Fail(ErrorKind::Config, "--call-timeout-ms must be > 0");

  return R::Ok(std::move(o));
}

} // namespace gdbflash::app
