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

#include "app/cli.hpp"
#include "app/version.hpp"

#include <charconv>
#include <string_view>

#include <spdlog/spdlog.h>

namespace solo::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

template <class Int>
static core::Result<Int> read_int_value(int& i, int argc, char** argv, std::string_view a, std::string_view opt) noexcept {
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<Int>::Fail(std::move(vr.st));

  Int v{};
  const auto* first = vr.value.data();
  const auto* last = first + vr.value.size();
  const auto [p, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || p != last) return core::Result<Int>::Failf("{}: not a number: {}", opt, vr.value);
  return core::Result<Int>::Ok(v);
}

std::string usage_text() {
  std::string out;
  out.reserve(1024);

  out += "solo v";
  out += solo_version();
  out += "\n\n";

  out += R"(Usage:
  solo-demo [options] [--] [args...]

The first solo-demo started for a given name keeps running and logs the
arguments of every later start. Later starts hand their command line to it
and exit immediately.

Options:
  --name <unique-name>         identity to coordinate on (default: $SOLO_UNIQUE_NAME,
                               else a hash of this executable's path)
  --timeout-ms <n>             how long a later start tries to reach the first one (default 3000)
  --max-invocations <n>        first instance exits after n forwarded starts (default: run until signalled)
  --verbose, -v                enable verbose logging
  --quiet, -q                  only log warnings and errors
  --help, -h
  --version
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--") {
      for (++i; i < argc; ++i) o.app_args.emplace_back(argv[i]);
      break;
    }

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }

    if (a == "--verbose" || a == "-v") { spdlog::set_level(spdlog::level::debug); continue; }
    if (a == "--quiet" || a == "-q") { spdlog::set_level(spdlog::level::warn); continue; }

    if (is_opt(a, "--name")) {
      auto vr = read_string_value(i, argc, argv, a, "--name");
      if (!vr) return core::Result<Options>::Fail(std::move(vr.st));
      if (vr.value.empty()) return core::Result<Options>::Fail("--name must not be empty");
      o.unique_name = std::string(vr.value);
      continue;
    }

    if (is_opt(a, "--timeout-ms")) {
      auto vr = read_int_value<int>(i, argc, argv, a, "--timeout-ms");
      if (!vr) return core::Result<Options>::Fail(std::move(vr.st));
      if (vr.value <= 0) return core::Result<Options>::Fail("--timeout-ms must be positive");
      o.timeout_ms = vr.value;
      continue;
    }

    if (is_opt(a, "--max-invocations")) {
      auto vr = read_int_value<std::size_t>(i, argc, argv, a, "--max-invocations");
      if (!vr) return core::Result<Options>::Fail(std::move(vr.st));
      o.max_invocations = vr.value;
      continue;
    }

    if (a.starts_with("-") && a.size() > 1) {
      return core::Result<Options>::Fail("Unknown option: " + std::string(a));
    }

    o.app_args.emplace_back(a);
  }

  return core::Result<Options>::Ok(std::move(o));
}

} // namespace solo::app
