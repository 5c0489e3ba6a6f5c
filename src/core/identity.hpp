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
#include <filesystem>
#include <string>
#include <string_view>

namespace solo::core {

// Unpadded URL-safe Base64 of SHA-256(|bytes|). 43 chars of [A-Za-z0-9_-].
std::string sha256_text(std::string_view bytes);

// Identity for an executable path. Same path, same identity, on every run.
std::string unique_name_for_path(const std::filesystem::path& exe);

Result<std::filesystem::path> current_executable_path() noexcept;

// unique_name_for_path(current_executable_path()).
Result<std::string> default_unique_name() noexcept;

// Machine name and effective user, both never empty.
std::string domain_name();
std::string user_name();

// Longest name a local endpoint can carry on this platform.
std::size_t max_endpoint_name();

struct EndpointNames {
  std::string mutex; // Mutex_{domain}_{user}_{identity}
  std::string pipe;  // Pipe_{domain}_{user}_{identity}

  static EndpointNames for_identity(std::string_view identity);
  static EndpointNames for_identity(std::string_view identity, std::string_view domain, std::string_view user);
};

} // namespace solo::core
