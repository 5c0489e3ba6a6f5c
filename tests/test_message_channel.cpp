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

#include "ipc/message_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <unistd.h>

namespace solo::ipc {

// Reaches the live listener to simulate the endpoint failing underneath the
// worker while the server is still open.
struct ChannelServerTestAccess {
  static void break_listener(ChannelServer& srv) {
    std::lock_guard lk(srv.listener_mtx_);
    srv.listener_.shutdown();
  }
};

} // namespace solo::ipc

using solo::core::Payload;
using solo::ipc::ChannelServer;

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

static std::string pipe_name(const char* tag) {
  return fmt::format("solo-test-pipe-{}-{}", ::getpid(), tag);
}

// Collects delivered payloads from the channel's worker thread.
struct Inbox {
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<Payload> got;

  std::shared_ptr<solo::core::CallbackDispatcher> dispatcher() {
    return std::make_shared<solo::core::CallbackDispatcher>(
        [this](const Payload& p) {
          {
            std::lock_guard lk(mtx);
            got.push_back(p);
          }
          cv.notify_all();
        },
        nullptr);
  }

  bool wait_for_count(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
    std::unique_lock lk(mtx);
    return cv.wait_for(lk, timeout, [&] { return got.size() >= n; });
  }

  std::size_t count() {
    std::lock_guard lk(mtx);
    return got.size();
  }
};

static bool send_raw(const std::string& name, std::string_view bytes) {
  auto cr = solo::platform::LocalConnection::connect(name, 3000);
  if (!cr) return false;
  const std::span<const std::uint8_t> data{reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()};
  return cr.value.send_all(data) && cr.value.finish_sending();
}

// ----- one sender -----

static void test_single_message() {
  Inbox inbox;
  ChannelServer srv;
  const std::string name = pipe_name("single");

  check("single_idle", srv.state() == ChannelServer::State::Idle);
  check("single_start", static_cast<bool>(srv.start(name, inbox.dispatcher())));
  check("single_listening", srv.state() == ChannelServer::State::Listening);
  check("single_name", srv.name() == name);

  check("single_send", static_cast<bool>(solo::ipc::send_payload(name, {"appA", "--open", "file.txt"})));
  check("single_received", inbox.wait_for_count(1));
  {
    std::lock_guard lk(inbox.mtx);
    check("single_payload", inbox.got.size() == 1 && inbox.got[0] == Payload{"appA", "--open", "file.txt"});
  }

  check("single_restart_refused", !srv.start(name, inbox.dispatcher()));

  srv.stop();
  check("single_closed", srv.state() == ChannelServer::State::Closed);
  srv.stop();
  check("single_stop_idempotent", srv.state() == ChannelServer::State::Closed);
}

// ----- many senders at once -----

static void test_concurrent_senders() {
  constexpr int kSenders = 8;
  Inbox inbox;
  ChannelServer srv;
  const std::string name = pipe_name("many");
  check("many_start", static_cast<bool>(srv.start(name, inbox.dispatcher())));

  std::vector<int> ok(kSenders, 0);
  std::vector<std::thread> senders;
  for (int i = 0; i < kSenders; ++i) {
    senders.emplace_back([&, i] {
      ok[i] = solo::ipc::send_payload(name, {"sender", std::to_string(i)}).ok ? 1 : 0;
    });
  }
  for (auto& t : senders) t.join();

  int sent = 0;
  for (int v : ok) sent += v;
  check("many_all_sent", sent == kSenders);
  check("many_all_received", inbox.wait_for_count(kSenders));

  std::vector<int> seen(kSenders, 0);
  {
    std::lock_guard lk(inbox.mtx);
    for (const auto& p : inbox.got) {
      if (p.size() == 2 && p[0] == "sender") {
        const int idx = std::stoi(p[1]);
        if (idx >= 0 && idx < kSenders) ++seen[idx];
      }
    }
  }
  bool each_once = true;
  for (int v : seen) each_once = each_once && v == 1;
  check("many_each_once", each_once);
  check("many_one_endpoint", srv.endpoints_opened() == 1);

  srv.stop();
}

// ----- bad clients do not take the server down -----

static void test_survives_bad_clients() {
  Inbox inbox;
  ChannelServer srv;
  const std::string name = pipe_name("bad");
  check("bad_start", static_cast<bool>(srv.start(name, inbox.dispatcher())));

  check("bad_garbage_sent", send_raw(name, "this is not a payload"));
  check("bad_truncated_sent", send_raw(name, "<Payload><CommandLineArguments><string>x"));
  {
    auto cr = solo::platform::LocalConnection::connect(name, 3000);
    check("bad_silent_connect", static_cast<bool>(cr));
    // Dropped without sending anything.
  }

  check("bad_valid_sent", static_cast<bool>(solo::ipc::send_payload(name, {"after"})));
  check("bad_valid_received", inbox.wait_for_count(1));

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  {
    std::lock_guard lk(inbox.mtx);
    check("bad_only_valid", inbox.got.size() == 1 && inbox.got[0] == Payload{"after"});
  }
  check("bad_still_listening", srv.state() != ChannelServer::State::Closed);
  check("bad_one_endpoint", srv.endpoints_opened() == 1);

  srv.stop();
}

// ----- nobody listening -----

static void test_no_listener() {
  const auto t0 = std::chrono::steady_clock::now();
  auto st = solo::ipc::send_payload(pipe_name("nobody"), {"x"}, 200);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

  check("nobody_fails", !st);
  check("nobody_waited", ms >= 150);
  check("nobody_bounded", ms < 2000);
}

static void test_closed_server_unreachable() {
  Inbox inbox;
  ChannelServer srv;
  const std::string name = pipe_name("closed");
  check("closed_start", static_cast<bool>(srv.start(name, inbox.dispatcher())));
  srv.stop();

  check("closed_send_fails", !solo::ipc::send_payload(name, {"late"}, 200));
  check("closed_nothing_delivered", inbox.count() == 0);
}

// ----- stop from inside the handler -----

static void test_stop_from_handler() {
  ChannelServer srv;
  const std::string name = pipe_name("self-stop");
  std::mutex mtx;
  std::condition_variable cv;
  bool handled = false;

  auto d = std::make_shared<solo::core::CallbackDispatcher>(
      [&](const Payload&) {
        srv.stop();
        {
          std::lock_guard lk(mtx);
          handled = true;
        }
        cv.notify_all();
      },
      nullptr);

  check("self_stop_start", static_cast<bool>(srv.start(name, d)));
  check("self_stop_send", static_cast<bool>(solo::ipc::send_payload(name, {"bye"})));
  {
    std::unique_lock lk(mtx);
    check("self_stop_handled", cv.wait_for(lk, std::chrono::seconds(10), [&] { return handled; }));
  }
  srv.stop();
  check("self_stop_closed", srv.state() == ChannelServer::State::Closed);
}

// ----- client already waiting when the worker starts -----

static void test_stop_from_handler_queued_client() {
  ChannelServer srv;
  const std::string name = pipe_name("queued-stop");
  std::mutex mtx;
  std::condition_variable cv;
  bool handled = false;

  auto d = std::make_shared<solo::core::CallbackDispatcher>(
      [&](const Payload&) {
        srv.stop();
        {
          std::lock_guard lk(mtx);
          handled = true;
        }
        cv.notify_all();
      },
      nullptr);

  // The sender retries its connect until the endpoint exists, so it is in
  // the backlog by the time the worker first accepts.
  int sent = 0;
  std::thread sender([&] { sent = solo::ipc::send_payload(name, {"early"}, 5000).ok ? 1 : 0; });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  check("queued_stop_start", static_cast<bool>(srv.start(name, d)));
  sender.join();
  check("queued_stop_sent", sent == 1);
  {
    std::unique_lock lk(mtx);
    check("queued_stop_handled", cv.wait_for(lk, std::chrono::seconds(10), [&] { return handled; }));
  }
  srv.stop();
  check("queued_stop_closed", srv.state() == ChannelServer::State::Closed);
}

// ----- endpoint failure while open -----

static void test_reopens_broken_endpoint() {
  Inbox inbox;
  ChannelServer srv;
  const std::string name = pipe_name("reopen");
  check("reopen_start", static_cast<bool>(srv.start(name, inbox.dispatcher())));
  check("reopen_first_endpoint", srv.endpoints_opened() == 1);

  solo::ipc::ChannelServerTestAccess::break_listener(srv);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (srv.endpoints_opened() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  check("reopen_second_endpoint", srv.endpoints_opened() == 2);
  check("reopen_not_closed", srv.state() != ChannelServer::State::Closed);

  check("reopen_send", static_cast<bool>(solo::ipc::send_payload(name, {"after", "reopen"})));
  check("reopen_received", inbox.wait_for_count(1));
  {
    std::lock_guard lk(inbox.mtx);
    check("reopen_payload", inbox.got.size() == 1 && inbox.got[0] == Payload{"after", "reopen"});
  }

  srv.stop();
  check("reopen_closed", srv.state() == ChannelServer::State::Closed);
}

int main() {
  test_single_message();
  test_concurrent_senders();
  test_survives_bad_clients();
  test_no_listener();
  test_closed_server_unreachable();
  test_stop_from_handler();
  test_stop_from_handler_queued_client();
  test_reopens_broken_endpoint();

  std::fprintf(stdout, "message_channel: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
