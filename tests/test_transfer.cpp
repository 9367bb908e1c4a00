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

#include "transfer/orchestrator.hpp"

#include "fake_gdb.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

namespace fs = std::filesystem;
using gdbflash::core::ErrorKind;
using gdbflash::testing::FakeGdb;
using gdbflash::testing::FakeTarget;
using namespace gdbflash;
using namespace gdbflash::transfer;

static fs::path g_base;

constexpr std::uint64_t kRam = 0x20000000;

static std::vector<std::byte> random_image(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::byte> v(n);
  for (auto& b : v) b = static_cast<std::byte>(dist(rng));
  return v;
}

static std::size_t files_in(const fs::path& dir) {
  std::error_code ec;
  std::size_t n = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ++n;
  return n;
}

// Everything a transfer needs: a fake target, an attached session,
// a staging directory and recorded events.
struct Rig {
  std::shared_ptr<FakeTarget> target = std::make_shared<FakeTarget>();
  std::unique_ptr<TransferSession> session;
  std::optional<io::WorkDir> workdir;

  std::vector<ProgressEvent> progress;
  std::vector<std::pair<std::size_t, unsigned>> retries;
  std::vector<std::pair<std::size_t, ChunkState>> states;
  std::vector<std::string> errors;
  int done = 0;

  Rig(std::size_t ram_size, std::size_t chunk_size, int call_timeout_ms = 200, std::uint64_t flash_base = 0) {
    target->ram.assign(ram_size, 0);

    gdb::SessionCfg cfg;
    cfg.response_timeout_ms = 500;
    cfg.call_timeout_ms = call_timeout_ms;
    cfg.startup_timeout_ms = 500;
    cfg.shutdown_timeout_ms = 100;

    auto dr = gdb::DebuggerSession::create(std::make_unique<FakeGdb>(target), cfg);
    if (dr && !dr.value->attach("localhost:61234", false).ok) std::fprintf(stderr, "rig: attach failed\n");

    TargetParameters p{
      .ram_buffer_address = kRam,
      .ram_buffer_size = ram_size,
      .flash_base = flash_base,
      .copy_function = "flash_copy",
      .chunk_size = chunk_size,
    };
    session = std::make_unique<TransferSession>(std::move(p), dr ? std::move(dr.value) : nullptr);

    auto wr = io::WorkDir::create(g_base);
    if (wr) workdir.emplace(std::move(wr.value));
  }

  Hooks hooks() {
    Hooks h;
    h.on_progress = [this](const ProgressEvent& ev) { progress.push_back(ev); };
    h.on_retry = [this](std::size_t i, unsigned a, const core::Status&) { retries.emplace_back(i, a); };
    h.on_chunk_state = [this](std::size_t i, ChunkState s) { states.emplace_back(i, s); };
    h.on_error = [this](const std::string& m) { errors.push_back(m); };
    h.on_done = [this] { ++done; };
    return h;
  }

  core::Status run(std::span<const std::byte> image, TransferPolicy policy, Hooks h, std::stop_token st = {}) {
    Orchestrator o(policy, std::move(h));
    io::ChunkStore store(workdir->path());
    return o.run(*session, image, store, st);
  }

  core::Status run(std::span<const std::byte> image, TransferPolicy policy = {}) {
    return run(image, policy, hooks());
  }

  bool flash_equals(std::span<const std::byte> image) const {
    const auto& f = target->flash;
    if (f.size() != image.size()) return false;
    for (std::size_t i = 0; i < f.size(); ++i)
      if (f[i] != std::to_integer<std::uint8_t>(image[i])) return false;
    return true;
  }

  bool shut_down() const { return target->disconnected && target->quit && target->closed; }
};

// ----- end to end -----

static void test_scenario_a_complete() {
  constexpr std::size_t kChunk = 64 * 1024;
  const auto image = random_image(6 * 1024 * 1024 + 1234, 1);
  Rig rig(kChunk, kChunk);

  auto st = rig.run(image);
  const auto& pr = rig.session->progress();

  check("a_ok", st.ok);
  check("a_completed", rig.session->state() == SessionState::Completed);
  check("a_counts", pr.chunks_total == 97 && pr.chunks_done == pr.chunks_total && pr.bytes_remaining == 0);
  check("a_flash", rig.flash_equals(image));
  check("a_one_call_per_chunk", rig.target->calls == 97 && rig.target->restores == 97);
  check("a_events", rig.progress.size() == 97 && rig.done == 1 && rig.errors.empty() && rig.retries.empty());

  bool ordered = true;
  for (std::size_t i = 0; i < rig.progress.size(); ++i) {
    const auto& ev = rig.progress[i];
    ordered = ordered && ev.chunk_index == i && ev.chunks_total == 97 && ev.attempts == 1;
  }
  check("a_progress_ordered", ordered);
  check("a_last_remaining", !rig.progress.empty() && rig.progress.back().bytes_remaining == 0 &&
                            rig.progress.front().bytes_remaining == image.size() - kChunk);

  check("a_shutdown", rig.shut_down());
  check("a_staging_clean", files_in(rig.workdir->path()) == 0);
}

static void test_chunk_states() {
  const auto image = random_image(3000, 2);
  Rig rig(1024, 1024);
  check("states_ok", rig.run(image).ok);

  std::vector<ChunkState> first;
  for (const auto& [i, s] : rig.states) if (i == 0) first.push_back(s);
  check("states_sequence", first == std::vector<ChunkState>{ChunkState::Staged, ChunkState::Restored,
                                                            ChunkState::CopyInvoked, ChunkState::Verified,
                                                            ChunkState::Advanced});
}

static void test_flash_base_and_short_chunks() {
  const auto image = random_image(10'000, 3);
  Rig rig(8192, 1000, 200, 0x40000);
  check("base_ok", rig.run(image).ok);
  check("base_params", rig.session->params().flash_base == 0x40000 && rig.session->params().chunk_size == 1000);
  check("base_chunks", rig.session->progress().chunks_total == 10 && rig.target->calls == 10);
  check("base_first_call", rig.target->count("call flash_copy(0x40000, 1000)") == 1);
  check("base_last_call", rig.target->count("call flash_copy(0x42328, 1000)") == 1);

  const auto& f = rig.target->flash;
  bool ok = f.size() == 0x40000 + image.size();
  for (std::size_t i = 0; ok && i < image.size(); ++i) ok = f[0x40000 + i] == std::to_integer<std::uint8_t>(image[i]);
  check("base_flash", ok);
}

static void test_scenario_b_retry_once() {
  constexpr std::size_t kChunk = 4096;
  const auto image = random_image(10 * kChunk, 4);
  Rig rig(kChunk, kChunk);

  bool fired = false;
  rig.target->tamper = [&](std::size_t, std::uint64_t off, std::uint64_t) -> std::optional<std::uint32_t> {
    if (off == 5 * kChunk && !fired) {
      fired = true;
      return 0xDEADBEEF;
    }
    return std::nullopt;
  };

  auto st = rig.run(image);
  check("b_ok", st.ok && rig.session->state() == SessionState::Completed);
  check("b_flash", rig.flash_equals(image));
  check("b_retry_once", rig.retries.size() == 1 && rig.retries[0].first == 5 && rig.retries[0].second == 2);
  check("b_extra_call", rig.target->calls == 11 && rig.target->restores == 11);

  bool attempts_ok = rig.progress.size() == 10;
  for (const auto& ev : rig.progress) attempts_ok = attempts_ok && ev.attempts == (ev.chunk_index == 5 ? 2u : 1u);
  check("b_progress_attempts", attempts_ok);
  check("b_shutdown", rig.shut_down());
}

static void test_scenario_c_exhausted() {
  constexpr std::size_t kChunk = 2048;
  const auto image = random_image(8 * kChunk, 5);
  Rig rig(kChunk, kChunk);

  std::uint64_t max_off = 0;
  rig.target->tamper = [&](std::size_t, std::uint64_t off, std::uint64_t) -> std::optional<std::uint32_t> {
    max_off = std::max(max_off, off);
    if (off == 3 * kChunk) return 0;
    return std::nullopt;
  };

  TransferPolicy policy;
  policy.max_attempts = 3;
  auto st = rig.run(image, policy);

  check("c_failed", !st.ok && st.kind == ErrorKind::ChecksumMismatch);
  check("c_state", rig.session->state() == SessionState::Failed && rig.session->failed_chunk() == std::optional<std::size_t>{3});
  check("c_reason", rig.session->failure().msg.find("chunk 3") != std::string::npos);
  check("c_attempts", rig.target->calls == 3 + 3 && rig.retries.size() == 2);
  check("c_no_later_chunks", max_off == 3 * kChunk && rig.target->count("call flash_copy(0x2000,") == 0);
  check("c_progress_stops", rig.progress.size() == 3 && rig.done == 0 && rig.errors.size() == 1);
  check("c_shutdown", rig.shut_down());
  check("c_staging_clean", files_in(rig.workdir->path()) == 0);
}

// ----- retry triggers other than checksums -----

static void test_timeout_retried() {
  constexpr std::size_t kChunk = 1024;
  const auto image = random_image(4 * kChunk, 6);
  Rig rig(kChunk, kChunk);

  int stalls = 0;
  rig.target->stall = [&](std::string_view c) {
    if (c == "call flash_copy(0x800, 1024)" && stalls == 0) { ++stalls; return true; }
    return false;
  };

  auto st = rig.run(image);
  check("timeout_retry_ok", st.ok && rig.flash_equals(image));
  check("timeout_retry_once", rig.retries.size() == 1 && rig.retries[0].first == 2);
}

static void test_verify_ram() {
  constexpr std::size_t kChunk = 1024;
  const auto image = random_image(3 * kChunk + 10, 7);
  Rig rig(kChunk, kChunk);
  rig.target->corrupt_dump = [](std::size_t n) { return n == 1; };

  TransferPolicy policy;
  policy.verify_ram = true;
  auto st = rig.run(image, policy);

  check("verify_ok", st.ok && rig.flash_equals(image));
  check("verify_dumps", rig.target->dumps == 5);
  check("verify_retry_chunk1", rig.retries.size() == 1 && rig.retries[0].first == 1);
  check("verify_no_readback_left", files_in(rig.workdir->path()) == 0);
}

// ----- fatal paths -----

static void test_staging_failure() {
  const auto image = random_image(2048, 8);
  Rig rig(1024, 1024);

  Orchestrator o(TransferPolicy{}, rig.hooks());
  io::ChunkStore store(g_base / "missing-dir" / "nested");
  auto st = o.run(*rig.session, image, store);

  check("stage_fail_io", !st.ok && st.kind == ErrorKind::Io);
  check("stage_fail_chunk0", rig.session->failed_chunk() == std::optional<std::size_t>{0});
  check("stage_fail_no_restore", rig.target->restores == 0);
  check("stage_fail_shutdown", rig.shut_down());
}

static void test_config_failure() {
  const auto image = random_image(4096, 9);
  Rig rig(1024, 2048);

  auto st = rig.run(image);
  check("config_kind", !st.ok && st.kind == ErrorKind::Config);
  check("config_no_chunk", !rig.session->failed_chunk().has_value());
  check("config_nothing_sent", rig.target->restores == 0 && rig.target->calls == 0);
  check("config_shutdown", rig.shut_down());

  Rig empty(1024, 1024);
  auto est = empty.run(std::span<const std::byte>{});
  check("empty_image_config", !est.ok && est.kind == ErrorKind::Config);

  Rig no_attempts(1024, 1024);
  TransferPolicy zero;
  zero.max_attempts = 0;
  auto zst = no_attempts.run(image, zero);
  check("zero_attempts_config", !zst.ok && zst.kind == ErrorKind::Config);
}

// ----- cancellation -----

static void test_cancel_at_boundary() {
  constexpr std::size_t kChunk = 1024;
  const auto image = random_image(8 * kChunk, 10);
  Rig rig(kChunk, kChunk);

  std::stop_source stop;
  auto h = rig.hooks();
  h.on_progress = [&](const ProgressEvent& ev) {
    rig.progress.push_back(ev);
    if (ev.chunk_index == 2) stop.request_stop();
  };

  auto st = rig.run(image, TransferPolicy{}, std::move(h), stop.get_token());
  check("cancel_kind", !st.ok && st.kind == ErrorKind::Cancelled);
  check("cancel_state", rig.session->state() == SessionState::Failed && rig.session->failed_chunk() == std::optional<std::size_t>{3});
  check("cancel_no_more_calls", rig.target->calls == 3 && rig.progress.size() == 3);
  check("cancel_shutdown", rig.shut_down());
  check("cancel_staging_clean", files_in(rig.workdir->path()) == 0);
}

static void test_session_deadline() {
  constexpr std::size_t kChunk = 1024;
  const auto image = random_image(4 * kChunk, 11);
  Rig rig(kChunk, kChunk, 10'000);
  rig.target->stall = [](std::string_view c) { return c.starts_with("call flash_copy(0x400,"); };

  TransferPolicy policy;
  policy.session_timeout = std::chrono::seconds(1);

  const auto t0 = std::chrono::steady_clock::now();
  auto st = rig.run(image, policy);
  const auto dt = std::chrono::steady_clock::now() - t0;

  check("deadline_cancelled", !st.ok && st.kind == ErrorKind::Cancelled);
  check("deadline_chunk1", rig.session->failed_chunk() == std::optional<std::size_t>{1});
  check("deadline_bounded", dt < std::chrono::seconds(5));
  check("deadline_shutdown", rig.target->quit && rig.target->closed);
}

int main() {
  spdlog::set_level(spdlog::level::off);

  std::error_code ec;
  g_base = fs::temp_directory_path(ec) / "gdbflash-test-transfer";
  fs::remove_all(g_base, ec);
  fs::create_directories(g_base, ec);

  test_scenario_a_complete();
  test_chunk_states();
  test_flash_base_and_short_chunks();
  test_scenario_b_retry_once();
  test_scenario_c_exhausted();
  test_timeout_retried();
  test_verify_ram();
  test_staging_failure();
  test_config_failure();
  test_cancel_at_boundary();
  test_session_deadline();

  fs::remove_all(g_base, ec);

  std::fprintf(stdout, "transfer: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
