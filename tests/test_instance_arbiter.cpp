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

#include "ipc/instance_arbiter.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <sys/wait.h>
#include <unistd.h>

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

static std::string lock_name(const char* tag) {
  return fmt::format("solo-test-lock-{}-{}", ::getpid(), tag);
}

// Blocks until the write end of |fd| is closed by every holder.
static void wait_closed(int fd) {
  char c;
  while (::read(fd, &c, 1) < 0 && errno == EINTR) {}
}

// ----- N processes race for one name -----

static void test_concurrent_processes() {
  constexpr int kProcs = 8;
  const std::string name = lock_name("race");

  int start[2], results[2], release[2];
  if (::pipe(start) != 0 || ::pipe(results) != 0 || ::pipe(release) != 0) {
    check("race_pipes", false);
    return;
  }

  std::vector<pid_t> kids;
  for (int i = 0; i < kProcs; ++i) {
    const pid_t pid = ::fork();
    if (pid == 0) {
      ::close(start[1]);
      ::close(results[0]);
      ::close(release[1]);

      wait_closed(start[0]);
      const char verdict = solo::ipc::InstanceArbiter::process().try_claim(name) ? 'O' : 'C';
      (void)!::write(results[1], &verdict, 1);

      // Hold the decision until every sibling has decided.
      wait_closed(release[0]);
      ::_exit(0);
    }
    if (pid < 0) break;
    kids.push_back(pid);
  }
  check("race_forked", kids.size() == static_cast<std::size_t>(kProcs));

  ::close(start[0]);
  ::close(results[1]);
  ::close(release[0]);
  ::close(start[1]);

  int owners = 0, challengers = 0;
  for (std::size_t i = 0; i < kids.size(); ++i) {
    char v = 0;
    ssize_t n;
    do { n = ::read(results[0], &v, 1); } while (n < 0 && errno == EINTR);
    if (n != 1) break;
    if (v == 'O') ++owners;
    else ++challengers;
  }
  ::close(results[0]);
  ::close(release[1]);

  for (pid_t pid : kids) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  }

  check("race_one_owner", owners == 1);
  check("race_rest_challengers", challengers == kProcs - 1);
}

// ----- a dead owner's name is free again -----

static void test_released_on_exit() {
  const std::string name = lock_name("exit");

  const pid_t pid = ::fork();
  if (pid == 0) {
    ::_exit(solo::ipc::InstanceArbiter::process().try_claim(name) ? 0 : 1);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  check("exit_child_owned", WIFEXITED(status) && WEXITSTATUS(status) == 0);

  check("exit_parent_owns", solo::ipc::InstanceArbiter::process().try_claim(name));
}

// ----- held name is refused to others -----

static void test_held_name_refused() {
  const std::string name = lock_name("held");
  auto& arb = solo::ipc::InstanceArbiter::process();

  check("held_undecided", !arb.decision(name).has_value());
  check("held_claimed", arb.try_claim(name));
  check("held_decision", arb.decision(name) == std::optional<bool>(true));

  // The child's arbiter is a copy of ours, so ask the OS directly.
  const pid_t pid = ::fork();
  if (pid == 0) {
    auto lr = solo::platform::SingleInstanceLock::try_acquire(name);
    ::_exit(!lr && lr.st.sys_errno == EADDRINUSE ? 0 : 1);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  check("held_refused_elsewhere", WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

// ----- decisions are cached per name -----

static void test_cached_decision() {
  auto& arb = solo::ipc::InstanceArbiter::process();
  const std::string a = lock_name("cache-a");
  const std::string b = lock_name("cache-b");

  check("cache_first", arb.try_claim(a));
  check("cache_second_same", arb.try_claim(a));
  check("cache_other_name", arb.try_claim(b));
  check("cache_both_decided", arb.decision(a).has_value() && arb.decision(b).has_value());
}

int main() {
  test_concurrent_processes();
  test_released_on_exit();
  test_cached_decision();
  test_held_name_refused();

  std::fprintf(stdout, "instance_arbiter: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
