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

#include "core/identity.hpp"

#include <cstdio>
#include <string>
#include <string_view>

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

static void check_str(const char* label, const std::string& got, std::string_view expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s: expected %.*s, got %s\n", label, static_cast<int>(expected.size()),
                 expected.data(), got.c_str());
    ++g_fail;
  }
}

static bool url_safe(std::string_view s) {
  for (char c : s) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

// ----- FIPS 180-2 digests, unpadded URL-safe Base64 -----

static void test_sha256_text_vectors() {
  check_str("sha256_empty", solo::core::sha256_text(""), "47DEQpj8HBSa-_TImW-5JCeuQeRkm5NMpJWZG3hSuFU");
  check_str("sha256_abc", solo::core::sha256_text("abc"), "ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0");
}

static void test_path_identity() {
  const auto a = solo::core::unique_name_for_path("/usr/bin/app");
  check_str("path_vector", a, "wIiXK4-w7Ud_4AWNuke_8uMQsVD6GNsoReMiAYnlUt8");
  check("path_len", a.size() == 43);
  check("path_charset", url_safe(a));
  check("path_stable", solo::core::unique_name_for_path("/usr/bin/app") == a);
  check("path_differs", solo::core::unique_name_for_path("/usr/bin/app2") != a);
}

static void test_default_identity() {
  auto exe = solo::core::current_executable_path();
  check("exe_ok", static_cast<bool>(exe));
  if (!exe) return;
  check("exe_absolute", exe.value.is_absolute());

  auto id = solo::core::default_unique_name();
  check("default_ok", static_cast<bool>(id));
  check("default_matches_path", id && id.value == solo::core::unique_name_for_path(exe.value));

  auto again = solo::core::default_unique_name();
  check("default_stable", id && again && id.value == again.value);
}

static void test_scope_parts() {
  check("domain_nonempty", !solo::core::domain_name().empty());
  check("user_nonempty", !solo::core::user_name().empty());
}

// ----- endpoint names -----

static void test_endpoint_names() {
  auto n = solo::core::EndpointNames::for_identity("myapp", "host", "alice");
  check_str("names_mutex", n.mutex, "Mutex_host_alice_myapp");
  check_str("names_pipe", n.pipe, "Pipe_host_alice_myapp");

  auto other_user = solo::core::EndpointNames::for_identity("myapp", "host", "bob");
  check("names_per_user", other_user.mutex != n.mutex && other_user.pipe != n.pipe);

  auto local = solo::core::EndpointNames::for_identity("myapp");
  check("names_local_prefix", local.mutex.rfind("Mutex_", 0) == 0 && local.pipe.rfind("Pipe_", 0) == 0);
  check("names_local_distinct", local.mutex != local.pipe);
}

static void test_long_endpoint_names() {
  const std::string id(300, 'x');
  auto n = solo::core::EndpointNames::for_identity(id, "host", "alice");

  check("long_mutex_fits", n.mutex.size() <= solo::core::max_endpoint_name());
  check("long_pipe_fits", n.pipe.size() <= solo::core::max_endpoint_name());
  check_str("long_mutex_digest", n.mutex, "Mutex_" + solo::core::sha256_text("Mutex_host_alice_" + id));
  check_str("long_pipe_digest", n.pipe, "Pipe_" + solo::core::sha256_text("Pipe_host_alice_" + id));

  auto other = solo::core::EndpointNames::for_identity(id, "host", "bob");
  check("long_per_user", other.mutex != n.mutex);
}

int main() {
  test_sha256_text_vectors();
  test_path_identity();
  test_default_identity();
  test_scope_parts();
  test_endpoint_names();
  test_long_endpoint_names();

  std::fprintf(stdout, "identity: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
