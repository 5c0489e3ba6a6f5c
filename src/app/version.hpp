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

#include <string>

#include <fmt/format.h>

// Both normally come from the build (project version, git commit count).
#ifndef SOLO_VERSION
#define SOLO_VERSION "0.1.0"
#endif
#ifndef SOLO_COMMIT_COUNT
#define SOLO_COMMIT_COUNT "0"
#endif

namespace solo::app {

inline const std::string& solo_version() {
  static const std::string v = fmt::format("{}+{}", SOLO_VERSION, SOLO_COMMIT_COUNT);
  return v;
}

} // namespace solo::app
