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

#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sys/socket.h>
#include <unistd.h>

namespace solo {

// Owning socket descriptor plus logged syscall wrappers. A failing wrapper
// leaves errno as the syscall set it. Refused connects, busy binds and
// would-block I/O are routine for local endpoints and only logged at debug.
struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(std::exchange(o.fd, -1)) {}
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this != &o) take(std::exchange(o.fd, -1));
    return *this;
  }

  ~FileHandle() { close(); }

  FileHandle& take(int new_fd, bool close_old = true) noexcept {
    if (close_old) close();
    fd = new_fd;
    return *this;
  }

  void close() noexcept {
    if (fd >= 0) ::close(std::exchange(fd, -1));
  }

  bool valid() const noexcept { return fd >= 0; }

  int setsockopt(int level, int optname, const void* optval, socklen_t optlen,
                 const char* level_name, const char* opt_name) const noexcept
  {
    return logged_(::setsockopt(fd, level, optname, optval, optlen), spdlog::level::warn,
                   "setsockopt(fd={}, level={}, opt={})", fd, level_name, opt_name);
  }

  int getsockopt(int level, int optname, void* optval, socklen_t* optlen,
                 const char* level_name, const char* opt_name) const noexcept
  {
    return logged_(::getsockopt(fd, level, optname, optval, optlen), spdlog::level::warn,
                   "getsockopt(fd={}, level={}, opt={})", fd, level_name, opt_name);
  }

  ssize_t send(const void* buf, size_t len, int flags, const char* flags_desc) const noexcept {
    return logged_(::send(fd, buf, len, flags), spdlog::level::debug,
                   "send(fd={}, len={}, flags={})", fd, len, flags_desc);
  }

  ssize_t recv(void* buf, size_t len, int flags, const char* flags_desc) const noexcept {
    return logged_(::recv(fd, buf, len, flags), spdlog::level::debug,
                   "recv(fd={}, len={}, flags={})", fd, len, flags_desc);
  }

  static int socket(int domain, int type, int protocol,
                    const char* domain_name, const char* type_name, const char* proto_name) noexcept
  {
    return logged_(::socket(domain, type, protocol), spdlog::level::err,
                   "socket(domain={}, type={}, proto={})", domain_name, type_name, proto_name);
  }

  int bind(const struct sockaddr* addr, socklen_t addrlen) const noexcept {
    return logged_(::bind(fd, addr, addrlen), spdlog::level::debug, "bind(fd={})", fd);
  }

  int connect(const struct sockaddr* addr, socklen_t addrlen) const noexcept {
    return logged_(::connect(fd, addr, addrlen), spdlog::level::debug, "connect(fd={})", fd);
  }

  int listen(int backlog) const noexcept {
    return logged_(::listen(fd, backlog), spdlog::level::err, "listen(fd={}, backlog={})", fd, backlog);
  }

  int accept(struct sockaddr* addr, socklen_t* addrlen, int flags, const char* flags_desc) const noexcept {
#if defined(__linux__)
    const int rc = ::accept4(fd, addr, addrlen, flags);
#elif defined(__APPLE__)
    (void)flags;
    const int rc = ::accept(fd, addr, addrlen);
#else
#  error "accept with flags not implemented on this platform"
#endif
    return logged_(rc, spdlog::level::debug, "accept(fd={}, flags={})", fd, flags_desc);
  }

  int shutdown(int how, const char* how_desc) const noexcept {
    return logged_(::shutdown(fd, how), spdlog::level::debug, "shutdown(fd={}, how={})", fd, how_desc);
  }

private:
  template <class Rc, class... Args>
  static Rc logged_(Rc rc, spdlog::level::level_enum lvl, fmt::format_string<Args...> what, Args&&... args) noexcept {
    if (rc >= 0) return rc;
    const int e = errno;
    if (e != EAGAIN && e != EWOULDBLOCK && e != EINTR && e != EINPROGRESS) {
      spdlog::log(lvl, "{}: {}", fmt::format(what, std::forward<Args>(args)...), std::strerror(e));
    }
    errno = e;
    return rc;
  }
};

} // namespace solo

#define do_setsockopt(fd, level, optname, optval, optlen) \
  ((fd).valid() ? (fd).setsockopt(level, optname, optval, optlen, #level, #optname) : -1)
#define do_getsockopt(fd, level, optname, optval, optlen) \
  ((fd).valid() ? (fd).getsockopt(level, optname, optval, optlen, #level, #optname) : -1)

#define do_send(fd, buf, len, flags) ((fd).valid() ? (fd).send(buf, len, flags, #flags) : -1)
#define do_recv(fd, buf, len, flags) ((fd).valid() ? (fd).recv(buf, len, flags, #flags) : -1)

#define do_socket(domain, type, protocol) (FileHandle::socket(domain, type, protocol, #domain, #type, #protocol))
#define do_bind(fd, addr, addrlen) ((fd).valid() ? (fd).bind(addr, addrlen) : -1)
#define do_connect(fd, addr, addrlen) ((fd).valid() ? (fd).connect(addr, addrlen) : -1)
#define do_listen(fd, backlog) ((fd).valid() ? (fd).listen(backlog) : -1)
#define do_accept(fd, addr, addrlen, flags) ((fd).valid() ? (fd).accept(addr, addrlen, flags, #flags) : -1)
#define do_shutdown(fd, how) ((fd).valid() ? (fd).shutdown(how, #how) : -1)
