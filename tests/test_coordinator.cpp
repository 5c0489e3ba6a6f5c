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

#include "app/coordinator.hpp"
#include "core/event_queue.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <sys/wait.h>
#include <unistd.h>

using solo::app::Config;
using solo::app::Coordinator;
using solo::core::Payload;

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

static std::string test_name(const char* tag) {
  return fmt::format("solo-test-app-{}-{}", ::getpid(), tag);
}

static std::unique_ptr<Coordinator> make(Config cfg) {
  auto cr = Coordinator::create(std::move(cfg));
  return cr ? std::move(cr.value) : nullptr;
}

static int wait_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ----- owner and forwarding challengers -----

static void test_owner_receives_challengers() {
  constexpr int kChallengers = 2;
  const std::string name = test_name("launch");

  int ready[2];
  if (::pipe(ready) != 0) {
    check("launch_pipe", false);
    return;
  }

  // Challengers are forked before this process claims anything, then wait
  // until it listens.
  std::vector<pid_t> kids;
  for (int i = 0; i < kChallengers; ++i) {
    const pid_t pid = ::fork();
    if (pid == 0) {
      ::close(ready[1]);
      char c;
      while (::read(ready[0], &c, 1) < 0 && errno == EINTR) {}

      Config cfg;
      cfg.unique_name = name;
      auto coord = make(std::move(cfg));
      if (!coord) ::_exit(2);

      const bool owner = coord->launch_or_return([](const Payload&) {}, {"appA", "--open", "file.txt"});
      ::_exit(owner ? 1 : 0);
    }
    if (pid > 0) kids.push_back(pid);
  }
  ::close(ready[0]);

  auto queue = std::make_shared<solo::core::EventQueue>();
  Config cfg;
  cfg.unique_name = name;
  cfg.dispatch_target = queue;
  auto owner = make(std::move(cfg));
  check("launch_created", owner != nullptr);
  if (!owner) {
    ::close(ready[1]);
    for (pid_t pid : kids) wait_child(pid);
    return;
  }

  std::vector<Payload> got;
  check("launch_owner", owner->launch_or_return([&](const Payload& p) { got.push_back(p); }, {"appA"}));
  check("launch_is_owner", owner->is_owner());
  check("launch_listening", owner->server().state() == solo::ipc::ChannelServer::State::Listening);

  ::close(ready[1]);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
  while (got.size() < kids.size() && std::chrono::steady_clock::now() < deadline) {
    queue->run_one_for(std::chrono::milliseconds(100));
  }

  int challengers_ok = 0;
  for (pid_t pid : kids) challengers_ok += wait_child(pid) == 0 ? 1 : 0;
  check("launch_challengers_returned_false", challengers_ok == kChallengers);

  check("launch_all_delivered", got.size() == static_cast<std::size_t>(kChallengers));
  bool payload_ok = !got.empty();
  for (const auto& p : got) payload_ok = payload_ok && p == Payload{"appA", "--open", "file.txt"};
  check("launch_payload", payload_ok);

  // Decided once; no second listener, no forwarding.
  check("launch_cached", owner->launch_or_return([](const Payload&) {}, {"ignored"}));
  check("launch_one_endpoint", owner->server().endpoints_opened() == 1);

  owner->stop_listening();
  check("launch_stopped", owner->server().state() == solo::ipc::ChannelServer::State::Closed);
  check("launch_still_owner", owner->is_owner());
}

// ----- configuration -----

static void test_create_validation() {
  Config zero;
  zero.connect_timeout_ms = 0;
  check("create_zero_timeout", !Coordinator::create(std::move(zero)));

  Config empty;
  empty.unique_name = std::string();
  check("create_empty_name", !Coordinator::create(std::move(empty)));

  check("create_defaults", static_cast<bool>(Coordinator::create()));
}

static void test_unique_name_freezes() {
  auto coord = make({});
  check("freeze_created", coord != nullptr);
  if (!coord) return;

  check("freeze_set_before", static_cast<bool>(coord->set_unique_name(test_name("first"))));
  check("freeze_empty_refused", !coord->set_unique_name(""));

  auto id = coord->unique_name();
  check("freeze_value", id && id.value == test_name("first"));
  check("freeze_set_after", !coord->set_unique_name(test_name("second")));

  auto again = coord->unique_name();
  check("freeze_unchanged", again && again.value == test_name("first"));
}

static void test_default_identity() {
  auto coord = make({});
  check("default_created", coord != nullptr);
  if (!coord) return;

  auto id = coord->unique_name();
  auto expected = solo::core::default_unique_name();
  check("default_matches", id && expected && id.value == expected.value);
}

static void test_empty_handler_throws() {
  auto coord = make({});
  if (!coord) {
    check("empty_handler_created", false);
    return;
  }

  bool threw = false;
  try {
    coord->launch_or_return(solo::core::PayloadHandler{}, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  check("empty_handler_throws", threw);
  check("empty_handler_undecided", !coord->is_owner());
}

// ----- current dispatch target is captured at launch -----

static void test_captures_current_target() {
  auto queue = std::make_shared<solo::core::EventQueue>();
  solo::core::ScopedDispatchTarget scope(queue);

  Config cfg;
  cfg.unique_name = test_name("scoped");
  auto coord = make(std::move(cfg));
  if (!coord) {
    check("scoped_created", false);
    return;
  }

  int calls = 0;
  check("scoped_owner", coord->launch_or_return([&](const Payload&) { ++calls; }, {}));

  auto names = solo::core::EndpointNames::for_identity(test_name("scoped"));
  check("scoped_sent", static_cast<bool>(solo::ipc::send_payload(names.pipe, {"x"})));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (calls == 0 && std::chrono::steady_clock::now() < deadline) {
    queue->run_one_for(std::chrono::milliseconds(100));
  }
  check("scoped_ran_on_queue", calls == 1);
}

static void test_process_command_line() {
  auto cl = solo::app::process_command_line();
  check("cmdline_ok", static_cast<bool>(cl));
  check("cmdline_argv0", cl && !cl.value.empty() && cl.value[0].find("test_coordinator") != std::string::npos);
}

int main() {
  test_owner_receives_challengers();
  test_create_validation();
  test_unique_name_freezes();
  test_default_identity();
  test_empty_handler_throws();
  test_captures_current_target();
  test_process_command_line();

  std::fprintf(stdout, "coordinator: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
