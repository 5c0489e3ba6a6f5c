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

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace solo::app {

struct Options {
  bool help = false;
  bool version = false;

  std::optional<std::string> unique_name;
  int timeout_ms = 3000;

  // Owner exits after this many forwarded invocations. 0 = run until signalled.
  std::size_t max_invocations = 0;

  // Application arguments: non-options, and everything after "--".
  std::vector<std::string> app_args;
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace solo::app
