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

#include "single_instance.hpp"
#include "local_address.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace solo::posix_common {

// Apple doesn't have SOCK_CLOEXEC, but accept4 is not
// available either, so this is fine.
#ifndef SOCK_CLOEXEC
  #define SOCK_CLOEXEC 0
#endif

namespace {

#if defined(__APPLE__)
// A filesystem socket outlives a crashed owner. Nobody answers on a stale one.
bool stale_socket_path(const LocalAddress& addr) {
  FileHandle probe{do_socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
  if (!probe.valid()) return false;
  return do_connect(probe, addr.sa(), addr.len) != 0 && errno == ECONNREFUSED;
}
#endif

} // namespace

SingleInstanceLock::~SingleInstanceLock() {
#if defined(__APPLE__)
  // Clean up the filesystem socket so a future instance can acquire the lock.
  if (fd_.valid() && !fs_path_.empty()) ::unlink(fs_path_.c_str());
#endif
  // fd_ closes itself via FileHandle RAII
}

SingleInstanceLock::SingleInstanceLock(SingleInstanceLock&& o) noexcept { *this = std::move(o); }

SingleInstanceLock& SingleInstanceLock::operator=(SingleInstanceLock&& o) noexcept {
  if (this == &o) return *this;
  fd_ = std::move(o.fd_);
  name_ = std::move(o.name_);
  fs_path_ = std::move(o.fs_path_);
  return *this;
}

core::Result<SingleInstanceLock> SingleInstanceLock::try_acquire(std::string name) {
  using R = core::Result<SingleInstanceLock>;

  auto addr = make_local_address(name);
  if (!addr) return R::Failf("lock name unusable ({} bytes): {}", name.size(), name);

  FileHandle fd{do_socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
  if (!fd.valid()) return R::Errno("socket", errno);

  if (do_bind(fd, addr->sa(), addr->len) != 0) {
    int e = errno;
#if defined(__APPLE__)
    if (e == EADDRINUSE && stale_socket_path(*addr)) {
      spdlog::debug("SingleInstanceLock: removing stale {}", addr->fs_path);
      ::unlink(addr->fs_path.c_str());
      if (do_bind(fd, addr->sa(), addr->len) == 0) {
        return R::Ok(SingleInstanceLock{std::move(fd), std::move(name), std::move(addr->fs_path)});
      }
      e = errno;
    }
#endif
    return R::Errno(fmt::format("bind({})", name), e);
  }

  spdlog::debug("SingleInstanceLock: acquired {}", name);
  return R::Ok(SingleInstanceLock{std::move(fd), std::move(name), std::move(addr->fs_path)});
}

} // namespace solo::posix_common
