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

#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

#include <sys/socket.h>
#include <sys/un.h>

namespace solo::posix_common {

struct LocalAddress {
  sockaddr_un addr{};
  socklen_t len = 0;
  std::string fs_path; // Filesystem socket path. Empty for abstract names.

  const sockaddr* sa() const noexcept { return reinterpret_cast<const sockaddr*>(&addr); }
};

#if defined(__APPLE__)
inline constexpr std::string_view kLocalPathPrefix = "/tmp/solo_";
#endif

inline std::size_t max_local_name() noexcept {
#if defined(__linux__)
  return sizeof(sockaddr_un::sun_path) - 1;
#elif defined(__APPLE__)
  return sizeof(sockaddr_un::sun_path) - 1 - kLocalPathPrefix.size();
#else
  #error "Unsupported POSIX platform for local endpoints"
#endif
}

inline std::optional<LocalAddress> make_local_address(std::string_view name) noexcept {
  if (name.empty() || name.size() > max_local_name()) return std::nullopt;

  LocalAddress a;
  a.addr.sun_family = AF_UNIX;

#if defined(__linux__)
  // Linux abstract namespace socket: sun_path[0] is set to 0, and the name
  // starts from sun_path[1]. The socket will not appear in the filesystem.
  a.addr.sun_path[0] = '\0';
  std::memcpy(a.addr.sun_path + 1, name.data(), name.size());
  a.len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());
#elif defined(__APPLE__)
  // macOS doesn't support abstract namespace sockets, so we use a regular
  // filesystem socket in /tmp.
  a.fs_path.assign(kLocalPathPrefix);
  a.fs_path.append(name);
  std::memcpy(a.addr.sun_path, a.fs_path.c_str(), a.fs_path.size() + 1);
  a.len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + a.fs_path.size() + 1);
#endif

  return a;
}

} // namespace solo::posix_common
