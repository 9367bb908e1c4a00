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
#include <filesystem>
#include <optional>
#include <string>

namespace gdbflash::app {

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;
    bool quiet = false;

    std::filesystem::path bin;
    std::filesystem::path elf;

    std::string gdb = "arm-none-eabi-gdb";
    std::string remote = "localhost:61234";
    bool extended_remote = false;

    // Exactly one of these is set: a literal address or a symbol to resolve.
    std::optional<std::uint64_t> ram_buffer_address;
    std::optional<std::string> ram_buffer_symbol;

    std::uint64_t ram_size = 0;
    std::uint64_t flash_base = 0;
    std::string copy_fn;
    std::uint64_t chunk_size = 0; // defaults to ram_size

    unsigned retries = 3;
    int timeout_ms = 5'000;
    int call_timeout_ms = 30'000;
    unsigned session_timeout_s = 0;

    std::optional<std::filesystem::path> workdir;

    bool reset_halt = false;
    std::optional<std::string> run_to;
    bool verify_ram = false;
};

// Failures are Config errors.
core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace gdbflash::app
