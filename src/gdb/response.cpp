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

#include "gdb/response.hpp"

#include <charconv>
#include <limits>
#include <new>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace gdbflash::gdb {

using core::ErrorKind;

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;

std::optional<std::uint64_t> hex_u64(std::string_view s) {
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.remove_prefix(2);
  if (s.empty()) return std::nullopt;
  std::uint64_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

// Last line matching `re`, with its groups.
std::optional<std::smatch> last_match(const std::vector<std::string>& lines, const std::regex& re) {
  std::optional<std::smatch> out;
  for (const auto& l : lines) {
    std::smatch m;
    if (std::regex_search(l, m, re)) out = std::move(m);
  }
  return out;
}

} // namespace

std::string Response::text() const {
  std::string out;
  for (const auto& l : lines) {
    if (!out.empty()) out.push_back('\n');
    out += l;
  }
  return out;
}

ResponseGrammar ResponseGrammar::gdb_console() {
  ResponseGrammar g;
  g.version = "gdb-console-1";
  g.prompt = "(gdb) ";
  g.address_range = R"(\((0x[0-9a-fA-F]+) to (0x[0-9a-fA-F]+)\))";
  g.numeric_result = R"(\$[0-9]+ = (-?[0-9]+)\b)";
  g.address_value = R"(\$[0-9]+ = .*?(0x[0-9a-fA-F]+))";
  g.connected = R"(Remote debugging using)";
  g.errors = {
    R"(^No symbol )",
    R"(^No symbol table is loaded)",
    R"(^Function ".*" not defined)",
    R"(Cannot access memory at address)",
    R"(No such file or directory)",
    R"(^Undefined command)",
    R"(^The program being debugged (was signaled|stopped) while in a function called from GDB)",
    R"(^The program is not being run)",
    R"(^You can't do that without a process to debug)",
    R"(Remote connection closed)",
    R"(Remote communication error)",
    R"(Connection (refused|timed out))",
    R"(^Invalid number)",
    R"(^A syntax error in expression)",
  };
  return g;
}

ResponseParser ResponseParser::build_(const ResponseGrammar& g) {
  ResponseParser p;
  p.version_ = g.version;
  p.prompt_ = g.prompt;
  p.address_range_ = std::regex(g.address_range, kFlags);
  p.numeric_result_ = std::regex(g.numeric_result, kFlags);
  p.address_value_ = std::regex(g.address_value, kFlags);
  p.connected_ = std::regex(g.connected, kFlags);
  p.errors_.reserve(g.errors.size());
  for (const auto& e : g.errors) p.errors_.emplace_back(e, kFlags);
  return p;
}

core::Result<ResponseParser> ResponseParser::compile(const ResponseGrammar& g) noexcept {
  try {
    return core::Result<ResponseParser>::Ok(build_(g));
  } catch (const std::regex_error& e) {
    return core::Result<ResponseParser>::Failf(ErrorKind::Config, "grammar '{}': bad pattern: {}", g.version, e.what());
  } catch (const std::bad_alloc&) {
    return core::Result<ResponseParser>::Failf(ErrorKind::Config, "grammar '{}': out of memory", g.version);
  }
}

const ResponseParser& ResponseParser::gdb_default() {
  static const ResponseParser p = build_(ResponseGrammar::gdb_console());
  return p;
}

std::string_view ResponseParser::strip_prompt(std::string_view line) const noexcept {
  if (prompt_.empty()) return line;
  while (line.starts_with(prompt_)) line.remove_prefix(prompt_.size());
  return line;
}

std::optional<std::string> ResponseParser::error_line(const Response& r) const {
  for (const auto& l : r.lines)
    for (const auto& re : errors_)
      if (std::regex_search(l, re)) return l;
  return std::nullopt;
}

bool ResponseParser::connected(const Response& r) const {
  for (const auto& l : r.lines)
    if (std::regex_search(l, connected_)) return true;
  return false;
}

core::Status ResponseParser::not_found_(const Response& r, std::string_view what) const {
  if (auto e = error_line(r)) {
    return core::Status::Fail(ErrorKind::Command, fmt::format("'{}' failed: {}", r.command, *e), r.text());
  }
  return core::Status::Fail(ErrorKind::Parse,
    fmt::format("'{}': no {} in response (grammar {})", r.command, what, version_), r.text());
}

core::Result<AddressRange> ResponseParser::address_range(const Response& r) const {
  auto m = last_match(r.lines, address_range_);
  if (!m || m->size() < 3) return core::Result<AddressRange>::Fail(not_found_(r, "address range"));

  const auto start = hex_u64((*m)[1].str());
  const auto end = hex_u64((*m)[2].str());
  if (!start || !end) return core::Result<AddressRange>::Fail(not_found_(r, "valid address range"));
  if (*end < *start) {
    return core::Result<AddressRange>::Fail(ErrorKind::Parse,
      fmt::format("'{}': inverted address range 0x{:x} to 0x{:x}", r.command, *start, *end), r.text());
  }
  return core::Result<AddressRange>::Ok(AddressRange{.start = *start, .end = *end});
}

core::Result<std::uint32_t> ResponseParser::numeric_result(const Response& r) const {
  auto m = last_match(r.lines, numeric_result_);
  if (!m || m->size() < 2) return core::Result<std::uint32_t>::Fail(not_found_(r, "numeric result"));

  const std::string s = (*m)[1].str();
  std::int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return core::Result<std::uint32_t>::Fail(ErrorKind::Parse, fmt::format("'{}': bad integer '{}'", r.command, s), r.text());
  }

  // Signed results are reinterpreted the way the target stores them.
  if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::uint32_t>::max()) {
    return core::Result<std::uint32_t>::Fail(ErrorKind::Parse, fmt::format("'{}': {} does not fit 32 bits", r.command, v), r.text());
  }
  if (v < 0) return core::Result<std::uint32_t>::Ok(static_cast<std::uint32_t>(static_cast<std::int32_t>(v)));
  return core::Result<std::uint32_t>::Ok(static_cast<std::uint32_t>(v));
}

core::Result<std::uint64_t> ResponseParser::address_value(const Response& r) const {
  auto m = last_match(r.lines, address_value_);
  if (!m || m->size() < 2) return core::Result<std::uint64_t>::Fail(not_found_(r, "address"));

  const auto v = hex_u64((*m)[1].str());
  if (!v) return core::Result<std::uint64_t>::Fail(not_found_(r, "valid address"));
  return core::Result<std::uint64_t>::Ok(*v);
}

core::Result<AddressRange> parse_address_range(const Response& r) {
  return ResponseParser::gdb_default().address_range(r);
}

core::Result<std::uint32_t> parse_numeric_result(const Response& r) {
  return ResponseParser::gdb_default().numeric_result(r);
}

} // namespace gdbflash::gdb
