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
#include "filehandle.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include <sys/types.h>

namespace solo::posix_common {

// One accepted or connected stream on a local (Unix-domain) endpoint.
class LocalConnection {
public:
  LocalConnection() = default;
  explicit LocalConnection(int fd, std::string name);

  LocalConnection(const LocalConnection&) = delete;
  LocalConnection& operator=(const LocalConnection&) = delete;

  LocalConnection(LocalConnection&&) noexcept;
  LocalConnection& operator=(LocalConnection&&) noexcept;

  ~LocalConnection();

  // Connects to the listener bound to |name|. "Nobody listening" and "backlog
  // full" are retried until |timeout_ms| has elapsed.
  static core::Result<LocalConnection> connect(const std::string& name, int timeout_ms) noexcept;

  bool valid() const noexcept { return fd_.valid(); }

  void set_timeout_ms(int ms) noexcept { timeout_ms_ = (ms <= 0) ? 1 : ms; }
  int timeout_ms() const noexcept { return timeout_ms_; }

  // Writes every byte or fails. The deadline restarts after each progress.
  core::Status send_all(std::span<const std::uint8_t> data) noexcept;

  // Half-close: tells the peer the message is complete.
  core::Status finish_sending() noexcept;

  // Reads until the peer half-closes. Fails past |max_bytes| or when the peer
  // stays silent for timeout_ms().
  core::Result<std::string> read_to_end(std::size_t max_bytes) noexcept;

  core::Result<uid_t> peer_uid() const noexcept;

  const std::string& name() const noexcept { return name_; }

  void close() noexcept;

private:
  FileHandle fd_;
  int timeout_ms_ = 3000;
  std::string name_;
};

class LocalListener {
public:
  LocalListener() = default;
  ~LocalListener();

  LocalListener(const LocalListener&) = delete;
  LocalListener& operator=(const LocalListener&) = delete;

  core::Status bind_and_listen(std::string name, int backlog = 1) noexcept;

  // Waits up to |wait_ms| for one client. Ok(nullopt) when nobody came.
  core::Result<std::optional<LocalConnection>> accept_one(int wait_ms) noexcept;

  // Wakes a thread blocked in accept_one. The descriptor stays open until
  // close(), so it is safe to call while another thread is waiting.
  void shutdown() noexcept;
  void close() noexcept;

  bool listening() const noexcept { return fd_.valid(); }
  const std::string& name() const noexcept { return name_; }

private:
  FileHandle fd_;
  std::string name_;
  std::string fs_path_;
};

} // namespace solo::posix_common
