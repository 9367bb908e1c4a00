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

#include "gdb/session.hpp"

#include "fake_gdb.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
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
using namespace gdbflash::gdb;

static SessionCfg fast_cfg() {
  SessionCfg cfg;
  cfg.response_timeout_ms = 200;
  cfg.call_timeout_ms = 200;
  cfg.startup_timeout_ms = 200;
  cfg.shutdown_timeout_ms = 100;
  return cfg;
}

static std::unique_ptr<DebuggerSession> open_session(const std::shared_ptr<FakeTarget>& t, bool attach = true) {
  auto r = DebuggerSession::create(std::make_unique<FakeGdb>(t), fast_cfg());
  if (!r) return nullptr;
  auto s = std::move(r.value);
  if (attach && !s->attach("localhost:61234", false).ok) return nullptr;
  return s;
}

// ----- handshake -----

static void test_attach() {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t);
  check("attach_ok", s && s->attached() && s->running());
  check("attach_sequence",
        t->commands.size() == 5 && t->commands[0] == "set confirm off" && t->commands[1] == "set pagination off" &&
        t->commands[2] == "set height 0" && t->commands[3] == "set width 0" &&
        t->commands[4] == "target remote localhost:61234");
  check("attach_counts", s && s->commands_sent() == 5);
}

static void test_attach_extended() {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t, false);
  auto st = s->attach("10.0.0.2:3333", true);
  check("extended_ok", st.ok && t->commands.back() == "target extended-remote 10.0.0.2:3333");
}

static void test_attach_refused() {
  auto t = std::make_shared<FakeTarget>();
  t->connect_ok = false;
  auto s = open_session(t, false);
  auto st = s->attach("localhost:1", false);
  check("refused_startup", !st.ok && st.kind == ErrorKind::Startup);
  check("refused_detail", st.detail.find("Connection timed out") != std::string::npos);
  check("refused_not_attached", !s->attached());
}

static void test_create_rejects() {
  auto none = DebuggerSession::create(nullptr, fast_cfg());
  check("create_null_channel", !none && none.st.kind == ErrorKind::Startup);

  auto cfg = fast_cfg();
  cfg.grammar.numeric_result = "([";
  auto bad = DebuggerSession::create(std::make_unique<FakeGdb>(std::make_shared<FakeTarget>()), cfg);
  check("create_bad_grammar", !bad && bad.st.kind == ErrorKind::Config);
}

// ----- commands -----

static void test_restore_and_call(const fs::path& base) {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t);

  const auto p = base / "chunk.bin";
  {
    std::ofstream out(p, std::ios::binary);
    for (int i = 0; i < 256; ++i) out.put(static_cast<char>(i));
  }

  auto rr = s->restore(p, 0x20000000);
  check("restore_ok", rr && rr.value.start == 0x20000000u && rr.value.length() == 256);
  check("restore_cmd", t->commands.back() == "restore " + p.string() + " binary 0x20000000");

  auto cr = s->call("flash_copy", 0x1000, 256);
  check("call_ok", cr && cr.value == 255u * 256u / 2u);
  check("call_cmd", t->commands.back() == "call flash_copy(0x1000, 256)");
  check("flash_written", t->flash.size() == 0x1100 && t->flash[0x10FF] == 0xFF && t->flash[0x1001] == 0x01);

  auto missing = s->restore(base / "nope.bin", 0x20000000);
  check("restore_missing_command", !missing && missing.st.kind == ErrorKind::Command);

  auto unknown = s->call("nope", 0, 1);
  check("call_unknown_command", !unknown && unknown.st.kind == ErrorKind::Command);
}

static void test_symbols_and_monitor(const fs::path& base) {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t);

  auto a = s->address_of("ram_buf");
  check("address_of", a && a.value == 0x20000000u);

  auto bad = s->address_of("missing_sym");
  check("address_of_missing", !bad && bad.st.kind == ErrorKind::Command);

  check("monitor", s->monitor("reset").ok && t->commands.back() == "monitor reset");
  check("run_to", s->run_to("main").ok && t->count("break main") == 1 && t->commands.back() == "continue");
  auto nowhere = s->run_to("nowhere");
  check("run_to_unknown", !nowhere.ok && nowhere.kind == ErrorKind::Command);
  check("run_to_unknown_no_continue", t->count("continue") == 1);

  const auto out = base / "dump.bin";
  check("dump", s->dump_memory(out, 0x20000000, 0x20000010).ok && fs::file_size(out) == 16);

  auto r = s->send("frobnicate");
  check("send_returns_text", r && r.value.lines.size() == 1 && r.value.lines[0].starts_with("Undefined command"));
  check("send_no_markers", r && r.value.text().find("<<gdbflash") == std::string::npos);
}

// ----- timeouts and stale output -----

static void test_timeout_then_recover() {
  auto t = std::make_shared<FakeTarget>();
  bool once = true;
  t->stall = [&](std::string_view c) {
    if (c.starts_with("call ") && once) { once = false; return true; }
    return false;
  };
  auto s = open_session(t);

  const auto t0 = std::chrono::steady_clock::now();
  auto cr = s->call("flash_copy", 0, 16);
  const auto waited = std::chrono::steady_clock::now() - t0;
  check("timeout_kind", !cr && cr.st.kind == ErrorKind::Timeout);
  check("timeout_waited", waited >= std::chrono::milliseconds(150));

  // The late "$N = ..." and its marker must not leak into this response.
  auto a = s->address_of("ram_buf");
  check("stale_discarded", a && a.value == 0x20000000u);

  auto r = s->send("frobnicate");
  check("stale_gone", r && r.value.lines.size() == 1);
}

static void test_timeout_detail() {
  auto t = std::make_shared<FakeTarget>();
  t->stall_marker = [](std::string_view c) { return c == "continue"; };
  auto s = open_session(t);

  auto st = s->run_to("main");
  check("partial_kind", !st.ok && st.kind == ErrorKind::Timeout);
  check("partial_detail", st.detail.find("Continuing.") != std::string::npos &&
                          st.detail.find("Breakpoint 1, main") != std::string::npos);
}

// ----- cancellation and deadlines -----

static void test_cancelled() {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t);

  std::stop_source stop;
  stop.request_stop();
  const auto before = t->commands.size();
  auto r = s->send("monitor halt", stop.get_token());
  check("cancel_kind", !r && r.st.kind == ErrorKind::Cancelled);
  check("cancel_not_sent", t->commands.size() == before);
}

static void test_cancel_while_waiting() {
  auto t = std::make_shared<FakeTarget>();
  t->stall = [](std::string_view c) { return c.starts_with("call "); };
  auto cfg = fast_cfg();
  cfg.call_timeout_ms = 10'000;
  auto s = DebuggerSession::create(std::make_unique<FakeGdb>(t), cfg);
  check("cancel_wait_attach", s && s.value->attach("x:1", false).ok);
  if (!s) return;

  std::stop_source stop;
  std::jthread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.request_stop();
  });

  const auto t0 = std::chrono::steady_clock::now();
  auto r = s.value->call("flash_copy", 0, 1, stop.get_token());
  check("cancel_wait_kind", !r && r.st.kind == ErrorKind::Cancelled);
  check("cancel_wait_fast", std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
}

static void test_session_deadline() {
  auto t = std::make_shared<FakeTarget>();
  t->stall = [](std::string_view c) { return c.starts_with("call "); };
  auto s = open_session(t);

  s->set_deadline(std::chrono::steady_clock::now() + std::chrono::milliseconds(20));
  auto r = s->call("flash_copy", 0, 1);
  check("deadline_cancelled", !r && r.st.kind == ErrorKind::Cancelled);
  check("deadline_msg", !r && r.st.msg.find("deadline") != std::string::npos);
}

// ----- turn taking -----

static void test_one_command_in_flight() {
  auto t = std::make_shared<FakeTarget>();
  t->symbols["other_buf"] = 0x20004000;
  auto s = open_session(t);

  int bad = 0;
  {
    std::jthread a([&] {
      for (int i = 0; i < 50; ++i) {
        auto r = s->address_of("ram_buf");
        if (!r || r.value != 0x20000000u) ++bad;
      }
    });
    std::jthread b([&] {
      for (int i = 0; i < 50; ++i) {
        auto r = s->address_of("other_buf");
        if (!r || r.value != 0x20004000u) ++bad;
      }
    });
  }
  check("turns_not_mixed", bad == 0);
}

// ----- shutdown -----

static void test_shutdown() {
  auto t = std::make_shared<FakeTarget>();
  auto s = open_session(t);
  s->shutdown();
  check("shutdown_disconnect", t->disconnected && t->count("disconnect") == 1);
  check("shutdown_quit", t->quit && t->closed);
  check("shutdown_state", !s->running() && !s->attached());

  s->shutdown();
  check("shutdown_idempotent", t->count("disconnect") == 1);

  auto r = s->send("monitor halt");
  check("send_after_shutdown", !r && r.st.kind == ErrorKind::Io);
}

static void test_destructor_shuts_down() {
  auto t = std::make_shared<FakeTarget>();
  { auto s = open_session(t); }
  check("dtor_shutdown", t->disconnected && t->quit && t->closed);

  auto t2 = std::make_shared<FakeTarget>();
  { auto s = open_session(t2, false); }
  check("dtor_no_disconnect_unattached", !t2->disconnected && t2->quit && t2->closed);
}

// ----- real subprocess -----

// Minimal stand-in for gdb: answers the connect command and the completion
// markers, and refuses the connection when started with --refuse.
static const char* kScriptedGdb = R"(#!/bin/sh
refuse=0
[ "$2" = "--refuse" ] && refuse=1
while IFS= read -r line; do
  case "$line" in
    "target remote "*)
      ep="${line#target remote }"
      if [ $refuse = 1 ]; then echo "$ep: Connection refused."; else echo "Remote debugging using $ep"; fi ;;
    "echo "*) m="${line#echo }"; printf '%s\n' "${m%\\n}" ;;
    quit) exit 0 ;;
  esac
done
)";

static fs::path write_script(const fs::path& base) {
  const auto p = base / "scripted-gdb.sh";
  {
    std::ofstream out(p);
    out << kScriptedGdb;
  }
  std::error_code ec;
  fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace, ec);
  return p;
}

static void test_start_real_process(const fs::path& base) {
  const auto script = write_script(base);

  auto cfg = fast_cfg();
  cfg.startup_timeout_ms = 3000;
  cfg.response_timeout_ms = 3000;

  LaunchSpec spec;
  spec.gdb_path = script.string();
  spec.executable = base / "firmware.elf";
  spec.endpoint = "127.0.0.1:3333";

  auto r = DebuggerSession::start(spec, cfg);
  check("start_real_ok", r && r.value->attached() && r.value->running());
  if (r) {
    auto sr = r.value->send("set height 0");
    check("start_real_send", sr && sr.value.lines.empty());
    r.value->shutdown();
    check("start_real_shutdown", !r.value->running());
  }

  spec.extra_args = {"--refuse"};
  auto refused = DebuggerSession::start(spec, cfg);
  check("start_real_refused", !refused && refused.st.kind == ErrorKind::Startup);

  spec.extra_args.clear();
  spec.gdb_path = (base / "no-such-gdb").string();
  auto missing = DebuggerSession::start(spec, cfg);
  check("start_missing_gdb", !missing && missing.st.kind == ErrorKind::Startup);
}

int main() {
  spdlog::set_level(spdlog::level::off);

  std::error_code ec;
  const auto base = fs::temp_directory_path(ec) / "gdbflash-test-session";
  fs::remove_all(base, ec);
  fs::create_directories(base, ec);

  test_attach();
  test_attach_extended();
  test_attach_refused();
  test_create_rejects();
  test_restore_and_call(base);
  test_symbols_and_monitor(base);
  test_timeout_then_recover();
  test_timeout_detail();
  test_cancelled();
  test_cancel_while_waiting();
  test_session_deadline();
  test_one_command_in_flight();
  test_shutdown();
  test_destructor_shuts_down();
  test_start_real_process(base);

  fs::remove_all(base, ec);

  std::fprintf(stdout, "session: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
