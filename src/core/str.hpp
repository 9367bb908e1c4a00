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
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

namespace gdbflash::core {

constexpr unsigned char ascii_lower(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a') : c;
}

constexpr bool is_ws(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

constexpr std::string_view trim_ws(std::string_view s) noexcept {
    while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
    return s;
}

constexpr bool contains_ws(std::string_view s) noexcept {
    for (char c : s)
        if (is_ws(c)) return true;
    return false;
}

// Unsigned integer in decimal or 0x-hex, whole string only.
inline std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    s = trim_ws(s);
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        s.remove_prefix(2);
    }
    if (s.empty()) return std::nullopt;

    std::uint64_t v = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v, base);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return v;
}

// Like parse_u64, plus a binary k/m suffix ("64k" == 65536).
inline std::optional<std::uint64_t> parse_size(std::string_view s) noexcept {
    s = trim_ws(s);
    std::uint64_t mul = 1;
    if (!s.empty() && !(s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))) {
        const auto c = ascii_lower(static_cast<unsigned char>(s.back()));
        if (c == 'k') mul = 1024;
        else if (c == 'm') mul = 1024ull * 1024ull;
        if (mul != 1) s.remove_suffix(1);
    }
    auto v = parse_u64(s);
    if (!v) return std::nullopt;
    if (*v > std::numeric_limits<std::uint64_t>::max() / mul) return std::nullopt;
    return *v * mul;
}

constexpr bool is_c_identifier(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        const bool digit = c >= '0' && c <= '9';
        if (!(alpha || (i && (digit || c == ':' || c == '.')))) return false;
    }
    return true;
}

} // namespace gdbflash::core
