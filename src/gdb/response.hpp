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

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace gdbflash::gdb {

// Accumulated output of one command turn.
struct Response {
  std::string command;
  std::vector<std::string> lines;

  std::string text() const;
};

struct AddressRange {
  std::uint64_t start = 0;
  std::uint64_t end = 0;

  std::uint64_t length() const noexcept { return end >= start ? end - start : 0; }
};

// Textual patterns recognised in debugger output. Kept together so a
// debugger whose wording differs needs a new grammar and nothing else.
struct ResponseGrammar {
  std::string version;

  // Echoed before output when the debugger considers itself interactive.
  std::string prompt;
  // Two capture groups: start and end address.
  std::string address_range;
  // One capture group: a decimal integer.
  std::string numeric_result;
  // One capture group: a hex address.
  std::string address_value;
  // Any match means the remote target was attached.
  std::string connected;
  // Any match marks the line as a debugger-side failure.
  std::vector<std::string> errors;

  static ResponseGrammar gdb_console();
};

class ResponseParser {
public:
  static core::Result<ResponseParser> compile(const ResponseGrammar& g) noexcept;

  // Parsers for the stock grammar, compiled once.
  static const ResponseParser& gdb_default();

  const std::string& version() const noexcept { return version_; }

  // `line` without any leading prompt echoes.
  std::string_view strip_prompt(std::string_view line) const noexcept;

  core::Result<AddressRange> address_range(const Response& r) const;
  core::Result<std::uint32_t> numeric_result(const Response& r) const;
  core::Result<std::uint64_t> address_value(const Response& r) const;

  bool connected(const Response& r) const;

  // First line reporting a debugger-side failure, if any.
  std::optional<std::string> error_line(const Response& r) const;

private:
  ResponseParser() = default;
  static ResponseParser build_(const ResponseGrammar& g);

  core::Status not_found_(const Response& r, std::string_view what) const;

  std::string version_;
  std::string prompt_;
  std::regex address_range_;
  std::regex numeric_result_;
  std::regex address_value_;
  std::regex connected_;
  std::vector<std::regex> errors_;
};

core::Result<AddressRange> parse_address_range(const Response& r);
core::Result<std::uint32_t> parse_numeric_result(const Response& r);

} // namespace gdbflash::gdb
