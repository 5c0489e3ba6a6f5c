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

#include "platform/posix-common/local_stream.hpp"
#include "platform/posix-common/local_address.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#ifndef SOCK_CLOEXEC
#define SOCK_CLOEXEC 0
#endif
#ifndef SOCK_NONBLOCK
#define SOCK_NONBLOCK 0
#endif
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace solo::posix_common {

using Clock = std::chrono::steady_clock;

namespace {

constexpr auto kConnectRetryInterval = std::chrono::milliseconds(25);

int ms_until(Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

void set_nonblocking(const FileHandle& fd) noexcept {
  const int flags = ::fcntl(fd.fd, F_GETFL, 0);
  if (flags >= 0) (void)::fcntl(fd.fd, F_SETFL, flags | O_NONBLOCK);
#if defined(__APPLE__)
  (void)::fcntl(fd.fd, F_SETFD, FD_CLOEXEC);
  int one = 1;
  (void)do_setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
}

// Nobody bound, or bound but the accept queue is full.
bool retryable_connect_error(int e) {
  return e == ECONNREFUSED || e == ENOENT || e == EAGAIN || e == EWOULDBLOCK;
}

} // namespace

LocalConnection::LocalConnection(int fd, std::string name)
  : fd_(fd)
  , name_(std::move(name))
{
  set_nonblocking(fd_);
}

LocalConnection::~LocalConnection() { close(); }

LocalConnection::LocalConnection(LocalConnection&& o) noexcept { *this = std::move(o); }

LocalConnection& LocalConnection::operator=(LocalConnection&& o) noexcept {
  if (this == &o) return *this;
  close();
  fd_ = std::move(o.fd_);
  timeout_ms_ = o.timeout_ms_;
  name_ = std::move(o.name_);
  return *this;
}

void LocalConnection::close() noexcept {
  if (fd_.valid()) {
    spdlog::debug("LocalConnection: close {}", name_);
    fd_.close();
  }
}

core::Result<LocalConnection> LocalConnection::connect(const std::string& name, int timeout_ms) noexcept {
  using R = core::Result<LocalConnection>;

  auto addr = make_local_address(name);
  if (!addr) return R::Failf("endpoint name unusable ({} bytes): {}", name.size(), name);

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 1);
  int last_errno = ETIMEDOUT;

  for (;;) {
    FileHandle fd{do_socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0)};
    if (!fd.valid()) return R::Errno("socket", errno);
    set_nonblocking(fd);

    if (do_connect(fd, addr->sa(), addr->len) == 0) {
      LocalConnection c(fd.fd, name);
      fd.take(-1, false);
      c.set_timeout_ms(timeout_ms);
      spdlog::debug("LocalConnection: connected to {}", name);
      return R::Ok(std::move(c));
    }

    const int e = errno;
    if (e == EINPROGRESS) {
      pollfd pfd{};
      pfd.fd = fd.fd;
      pfd.events = POLLOUT;

      const int pr = ::poll(&pfd, 1, ms_until(deadline));
      if (pr == 0) return R::Errno(fmt::format("connect({})", name), ETIMEDOUT);
      if (pr < 0) return R::Errno("poll", errno);

      int soerr = 0;
      socklen_t len = sizeof(soerr);
      if (do_getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) != 0) return R::Errno("getsockopt", errno);
      if (soerr == 0) {
        LocalConnection c(fd.fd, name);
        fd.take(-1, false);
        c.set_timeout_ms(timeout_ms);
        return R::Ok(std::move(c));
      }
      last_errno = soerr;
      if (!retryable_connect_error(soerr)) return R::Errno(fmt::format("connect({})", name), soerr);
    } else if (e == EINTR) {
      continue;
    } else if (retryable_connect_error(e)) {
      last_errno = e;
    } else {
      return R::Errno(fmt::format("connect({})", name), e);
    }

    if (ms_until(deadline) == 0) return R::Errno(fmt::format("connect({}) gave up", name), last_errno);
    std::this_thread::sleep_for(std::min<Clock::duration>(kConnectRetryInterval, deadline - Clock::now()));
  }
}

core::Status LocalConnection::send_all(std::span<const std::uint8_t> data) noexcept {
  if (!fd_.valid()) return core::Status::Fail("LocalConnection::send_all: not connected");

  const std::uint8_t* p = data.data();
  std::size_t left = data.size();

  auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);

  while (left) {
    const int ms_left = ms_until(deadline);
    if (ms_left <= 0) return core::Status::Errno("LocalConnection::send_all", ETIMEDOUT);

    pollfd pfd{};
    pfd.fd = fd_.fd;
    pfd.events = POLLOUT;

    const int pr = ::poll(&pfd, 1, ms_left);
    if (pr == 0) return core::Status::Errno("LocalConnection::send_all", ETIMEDOUT);
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      return core::Status::Errno("LocalConnection::send_all: poll", e);
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      return core::Status::Errno("LocalConnection::send_all: peer closed", EPIPE);
    }

    const ssize_t n = do_send(fd_, p, left, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      left -= static_cast<std::size_t>(n);
      deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);
      continue;
    }

    const int e = errno;
    if (n < 0 && (e == EINTR || e == EAGAIN || e == EWOULDBLOCK)) continue;
    return core::Status::Errno("LocalConnection::send_all", n == 0 ? EPIPE : e);
  }

  spdlog::debug("LocalConnection::send_all {} bytes to {}", data.size(), name_);
  return core::Status::Ok();
}

core::Status LocalConnection::finish_sending() noexcept {
  if (do_shutdown(fd_, SHUT_WR) != 0) return core::Status::Errno("LocalConnection::finish_sending", errno);
  return core::Status::Ok();
}

core::Result<std::string> LocalConnection::read_to_end(std::size_t max_bytes) noexcept {
  using R = core::Result<std::string>;
  if (!fd_.valid()) return R::Fail("LocalConnection::read_to_end: not connected");

  std::string out;
  char buf[4096];

  for (;;) {
    pollfd pfd{};
    pfd.fd = fd_.fd;
    pfd.events = POLLIN;

    const int pr = ::poll(&pfd, 1, timeout_ms_);
    if (pr == 0) return R::Errno("LocalConnection::read_to_end: peer silent", ETIMEDOUT);
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      return R::Errno("LocalConnection::read_to_end: poll", e);
    }
    if (pfd.revents & POLLNVAL) return R::Errno("LocalConnection::read_to_end", EBADF);

    // POLLHUP still lets us drain whatever the peer wrote before closing.
    const ssize_t n = do_recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) {
      if (out.size() + static_cast<std::size_t>(n) > max_bytes) {
        return R::Failf("LocalConnection::read_to_end: message exceeds {} bytes", max_bytes);
      }
      out.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) break;

    const int e = errno;
    if (e == EINTR || e == EAGAIN || e == EWOULDBLOCK) continue;
    return R::Errno("LocalConnection::read_to_end", e);
  }

  spdlog::debug("LocalConnection::read_to_end {} bytes from {}", out.size(), name_);
  return R::Ok(std::move(out));
}

core::Result<uid_t> LocalConnection::peer_uid() const noexcept {
  using R = core::Result<uid_t>;
#if defined(__linux__)
  ucred cred{};
  socklen_t len = sizeof(cred);
  if (do_getsockopt(fd_, SOL_SOCKET, SO_PEERCRED, &cred, &len) != 0) return R::Errno("SO_PEERCRED", errno);
  return R::Ok(cred.uid);
#elif defined(__APPLE__)
  uid_t uid = 0;
  gid_t gid = 0;
  if (::getpeereid(fd_.fd, &uid, &gid) != 0) return R::Errno("getpeereid", errno);
  return R::Ok(uid);
#else
  #error "peer credentials not implemented on this platform"
#endif
}

LocalListener::~LocalListener() { close(); }

void LocalListener::close() noexcept {
  if (fd_.valid()) {
    spdlog::debug("LocalListener: close {}", name_);
    fd_.close();
  }
  if (!fs_path_.empty()) {
    ::unlink(fs_path_.c_str());
    fs_path_.clear();
  }
}

void LocalListener::shutdown() noexcept {
  (void)do_shutdown(fd_, SHUT_RDWR);
}

core::Status LocalListener::bind_and_listen(std::string name, int backlog) noexcept {
  close();
  name_ = std::move(name);

  auto addr = make_local_address(name_);
  if (!addr) return core::Status::Failf("endpoint name unusable ({} bytes): {}", name_.size(), name_);

  fd_.take(do_socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (!fd_.valid()) return core::Status::Errno("socket", errno);
  set_nonblocking(fd_);

  // Only the lock owner listens, so a leftover path belongs to a dead owner.
  if (!addr->fs_path.empty()) ::unlink(addr->fs_path.c_str());

  if (do_bind(fd_, addr->sa(), addr->len) != 0) {
    const int e = errno;
    fd_.close();
    return core::Status::Errno(fmt::format("bind({})", name_), e);
  }
  fs_path_ = addr->fs_path;

  if (do_listen(fd_, backlog) != 0) {
    const int e = errno;
    close();
    return core::Status::Errno("listen", e);
  }

  spdlog::debug("LocalListener: listening on {}", name_);
  return core::Status::Ok();
}

core::Result<std::optional<LocalConnection>> LocalListener::accept_one(int wait_ms) noexcept {
  using R = core::Result<std::optional<LocalConnection>>;
  if (!fd_.valid()) return R::Errno("LocalListener: not listening", EBADF);

  pollfd pfd{};
  pfd.fd = fd_.fd;
  pfd.events = POLLIN;

  for (;;) {
    const int pr = ::poll(&pfd, 1, wait_ms);
    if (pr == 0) return R::Ok(std::nullopt);
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      return R::Errno("LocalListener: poll", e);
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      return R::Errno("LocalListener: listener closed", (pfd.revents & POLLNVAL) ? EBADF : EINVAL);
    }
    break;
  }

  for (;;) {
    const int cfd = do_accept(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (cfd >= 0) {
      spdlog::debug("LocalListener: accepted on {}", name_);
      return R::Ok(std::optional<LocalConnection>{LocalConnection(cfd, name_)});
    }

    const int e = errno;
    if (e == EINTR) continue;
    // The client gave up between poll and accept.
    if (e == EAGAIN || e == EWOULDBLOCK || e == ECONNABORTED) return R::Ok(std::nullopt);
    return R::Errno("LocalListener: accept", e);
  }
}

} // namespace solo::posix_common
