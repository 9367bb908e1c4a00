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

#include "app/interface.hpp"
#include "app/version.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gdbflash::app {

namespace {

constexpr std::size_t kMaxEvents = 6;

static std::size_t u8_advance(std::string_view s, std::size_t i) {
  if (i >= s.size()) return s.size();
  const auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return i + 1;
  if ((c & 0xE0) == 0xC0) return std::min(i + 2, s.size());
  if ((c & 0xF0) == 0xE0) return std::min(i + 3, s.size());
  if ((c & 0xF8) == 0xF0) return std::min(i + 4, s.size());
  return i + 1;
}

static bool env_has_utf8() {
  auto has = [](const char *v) {
    if (!v || !*v) return false;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
  };
  return has(std::getenv("LC_ALL")) || has(std::getenv("LC_CTYPE")) || has(std::getenv("LANG"));
}

constexpr const char *kAltOn = "\x1b[?1049h";
constexpr const char *kAltOff = "\x1b[?1049l";
constexpr const char *kHideCursor = "\x1b[?25l";
constexpr const char *kShowCursor = "\x1b[?25h";

constexpr const char *kReset = "\x1b[0m";
constexpr const char *kBold = "\x1b[1m";

constexpr const char *kRed = "\x1b[31m";
constexpr const char *kGreen = "\x1b[32m";
constexpr const char *kYellow = "\x1b[33m";
constexpr const char *kBlue = "\x1b[34m";
constexpr const char *kCyan = "\x1b[36m";
constexpr const char *kGray = "\x1b[90m";

} // namespace

bool TransferInterface::is_tty_() { return ::isatty(1) == 1; }

bool TransferInterface::colors_enabled_() {
  if (!is_tty_()) return false;
  const char *no = std::getenv("NO_COLOR");
  return !(no && *no);
}

bool TransferInterface::utf8_enabled_() { return is_tty_() && env_has_utf8(); }

TransferInterface::TransferInterface(bool is_tty_enabled) {
  if (is_tty_enabled) {
    tty_ = is_tty_();
    color_ = colors_enabled_();
    utf8_ = utf8_enabled_();
  }
  start_ = last_rate_ts_ = last_redraw_ = std::chrono::steady_clock::now();

  if (tty_) std::cout << kAltOn << kHideCursor << std::flush;
}

TransferInterface::~TransferInterface() {
  std::string final;
  bool fatal = false;
  {
    std::lock_guard lk(mtx_);
    final = status_line_;
    fatal = fatal_;
  }

  if (tty_) std::cout << kShowCursor << kAltOff << std::flush;

  if (tty_ && !final.empty())
    (fatal ? std::cerr : std::cout) << final << "\n" << std::flush;
}

void TransferInterface::target(std::string endpoint, std::string elf) {
  std::lock_guard lk(mtx_);
  endpoint_ = std::move(endpoint);
  elf_ = std::move(elf);
  redraw_(true);
}

void TransferInterface::stage(std::string stage) {
  std::lock_guard lk(mtx_);
  stage_ = std::move(stage);
  redraw_(true);
}

void TransferInterface::plan(std::size_t chunks, std::uint64_t total_bytes) {
  std::lock_guard lk(mtx_);
  chunks_total_ = chunks;
  chunks_done_ = 0;
  bytes_total_ = total_bytes;
  bytes_done_ = 0;
  active_chunk_ = static_cast<std::size_t>(-1);
  active_state_.reset();
  retries_ = 0;

  last_rate_ts_ = std::chrono::steady_clock::now();
  last_rate_bytes_ = 0;
  ema_rate_bps_ = 0.0;

  redraw_(true);
}

void TransferInterface::chunk_state(std::size_t index, transfer::ChunkState state) {
  std::lock_guard lk(mtx_);
  active_chunk_ = index;
  active_state_ = state;
  redraw_(false);
}

void TransferInterface::retry(std::size_t index, unsigned attempt, std::string reason) {
  std::lock_guard lk(mtx_);
  ++retries_;
  events_.push_back(fmt::format("chunk {} attempt {}: {}", index, attempt, reason));
  while (events_.size() > kMaxEvents) events_.pop_front();
  redraw_(true);
}

void TransferInterface::progress(const transfer::ProgressEvent &ev) {
  std::lock_guard lk(mtx_);
  chunks_done_ = ev.chunk_index + 1;
  chunks_total_ = ev.chunks_total;
  bytes_done_ = bytes_total_ - std::min(bytes_total_, ev.bytes_remaining);

  const auto now = std::chrono::steady_clock::now();
  const auto dt = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_rate_ts_).count();
  const auto db = static_cast<double>(bytes_done_ - std::min(bytes_done_, last_rate_bytes_));

  if (dt >= 0.2) {
    const double inst = (dt > 0.0) ? (db / dt) : 0.0;
    ema_rate_bps_ = (ema_rate_bps_ <= 1e-9) ? inst : (ema_rate_bps_ * 0.80 + inst * 0.20);
    last_rate_ts_ = now;
    last_rate_bytes_ = bytes_done_;
  }
  redraw_(chunks_done_ == chunks_total_);
}

void TransferInterface::notice(std::string msg) {
  std::lock_guard lk(mtx_);
  notice_line_ = std::move(msg);
  redraw_(true);
}

void TransferInterface::fail(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = true;
  status_line_ = std::move(msg);
  redraw_(true);
}

void TransferInterface::done(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = false;
  status_line_ = std::move(msg);
  redraw_(true);
}

TransferInterface::TermSize TransferInterface::term_size_() const {
  winsize ws{};
  if (::ioctl(1, TIOCGWINSZ, &ws) == 0)
    return {static_cast<int>(ws.ws_row), static_cast<int>(ws.ws_col)};
  return {24, 80};
}

std::string TransferInterface::bytes_h_(std::uint64_t b) {
  const char *u[] = {"B", "KB", "MB", "GB", "TB"};
  int i = 0;
  double v = static_cast<double>(b);
  while (v >= 1024.0 && i < 4) {
    v /= 1024.0;
    ++i;
  }
  std::ostringstream oss;
  if (!i)
    oss << static_cast<std::uint64_t>(v) << u[i];
  else
    oss << std::fixed << std::setprecision(v >= 10 ? 1 : 2) << v << u[i];
  return oss.str();
}

std::string TransferInterface::rate_h_(double bps) {
  if (bps <= 1e-9) return "0B/s";
  return bytes_h_(static_cast<std::uint64_t>(bps)) + "/s";
}

std::string TransferInterface::eta_h_(std::optional<std::chrono::seconds> eta) {
  if (!eta) return "--:--";
  auto s = eta->count();
  const auto h = s / 3600; s %= 3600;
  const auto m = s / 60;   s %= 60;
  std::ostringstream oss;
  if (h) oss << h << "h";
  oss << std::setw(2) << std::setfill('0') << m << "m" << std::setw(2) << s << "s";
  return oss.str();
}

char TransferInterface::spinner_() const {
  static constexpr char sp[] = {'|', '/', '-', '\\'};
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start_).count();
  return sp[(ms / 120) % 4];
}

TransferInterface::Clip TransferInterface::clip_(std::string_view s, std::size_t max_cols) const {
  if (!max_cols) return {};

  if (!utf8_) {
    if (s.size() <= max_cols) return {std::string(s), s.size()};
    if (max_cols <= 3) return {std::string(s.substr(0, max_cols)), max_cols};
    return {std::string(s.substr(0, max_cols - 3)) + "...", max_cols};
  }

  auto take_cols = [&](std::size_t cols_want) -> std::pair<std::size_t, std::size_t> {
    std::size_t cols = 0, out_bytes = 0;
    for (std::size_t i = 0; i < s.size() && cols < cols_want;) {
      const std::size_t next = u8_advance(s, i);
      out_bytes = next;
      i = next;
      ++cols;
    }
    return {out_bytes, cols};
  };

  const auto [bytes_max, cols_max] = take_cols(max_cols);
  if (bytes_max >= s.size()) return {std::string(s), cols_max};

  if (max_cols == 1) return {"…", 1};

  const auto [bytes_keep, cols_keep] = take_cols(max_cols - 1);
  std::string out(s.substr(0, bytes_keep));
  out += "…";
  return {std::move(out), cols_keep + 1};
}

std::string TransferInterface::bar_(double frac, std::size_t w) const {
  frac = std::clamp(frac, 0.0, 1.0);
  const std::size_t filled = static_cast<std::size_t>(std::llround(frac * static_cast<double>(w)));

  std::string s;
  if (utf8_) {
    s.reserve(w * 3);
    for (std::size_t i = 0; i < w; ++i) s.append(i < filled ? "█" : "░");
    return s;
  }

  s.reserve(w);
  for (std::size_t i = 0; i < w; ++i) s.push_back(i < filled ? '=' : '-');
  return s;
}

void TransferInterface::redraw_(bool force) {
  const auto now = std::chrono::steady_clock::now();
  if (!force && (now - last_redraw_) < std::chrono::milliseconds(33)) return;
  last_redraw_ = now;

  if (!tty_) {
    // The orchestrator already logs every chunk; only milestones here.
    if (force) {
      spdlog::info("Stage={} Chunks={}/{} Bytes={}/{}{}{}",
                   (stage_.empty() ? "-" : stage_), chunks_done_, chunks_total_,
                   bytes_h_(bytes_done_), bytes_h_(bytes_total_),
                   (notice_line_.empty() ? "" : (" | " + notice_line_)),
                   (status_line_.empty() ? "" : (" | " + status_line_)));
    }
    return;
  }

  const auto ts = term_size_();
  const int cols = std::max(60, ts.cols);

  std::optional<std::chrono::seconds> eta;
  if (bytes_total_ && ema_rate_bps_ > 1.0 && bytes_done_ <= bytes_total_) {
    const double rem = static_cast<double>(bytes_total_ - bytes_done_);
    eta = std::chrono::seconds(static_cast<long long>(rem / ema_rate_bps_));
  }

  std::ostringstream out;
  out << "\x1b[H\x1b[J";

  auto emit = [&](const char *c, std::string_view plain) {
    const auto clipped = clip_(plain, static_cast<std::size_t>(cols)).s;
    if (color_) out << c;
    out << clipped;
    if (color_) out << kReset;
    out << "\n";
  };

  {
    const std::string title = fmt::format("gdbflash v{}", version_string());
    if (color_) out << kBold;
    emit(kGray, title);
    if (color_) out << kReset;
  }

  emit(kBlue, fmt::format("Target: {}  ELF: {}", (endpoint_.empty() ? "-" : endpoint_), (elf_.empty() ? "-" : elf_)));

  {
    std::string l = "Stage: " + (stage_.empty() ? std::string("-") : stage_);
    if (!chunks_total_ && !fatal_) l += fmt::format("  {}", spinner_());
    emit(kBlue, l);
  }

  {
    const int pct = bytes_total_ ? static_cast<int>((std::min(bytes_done_, bytes_total_) * 100) / bytes_total_) : 0;
    const std::string prefix = fmt::format("Overall: {:3}% ", pct);
    const std::string suffix = fmt::format("  {}/{}  {}  ETA {}", bytes_h_(bytes_done_), bytes_h_(bytes_total_),
                                           rate_h_(ema_rate_bps_), eta_h_(eta));

    const auto budget = static_cast<std::size_t>(cols);
    const auto used = clip_(prefix, budget).w + clip_(suffix, budget).w;
    const std::size_t bar_w = used + 10 <= budget ? budget - used : 10;

    const double frac = bytes_total_ ? (static_cast<double>(bytes_done_) / static_cast<double>(bytes_total_)) : 0.0;
    const char *col = fatal_ ? kRed : (!bytes_total_ ? kGray : kGreen);

    if (color_) out << kBold;
    emit(col, prefix + bar_(frac, bar_w) + suffix);
    if (color_) out << kReset;
  }

  {
    std::string l = fmt::format("Chunks: {}/{}  retries: {}", chunks_done_, chunks_total_, retries_);
    if (active_state_ && active_chunk_ < chunks_total_)
      l += fmt::format("  chunk {} {}", active_chunk_, transfer::state_name(*active_state_));
    emit(kCyan, l);
  }

  if (!notice_line_.empty()) emit(kGray, notice_line_);
  if (!status_line_.empty()) emit(fatal_ ? kRed : kGreen, status_line_);

  for (const auto &e : events_) emit(kYellow, e);

  std::cout << out.str() << std::flush;
}

} // namespace gdbflash::app
