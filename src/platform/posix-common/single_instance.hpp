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

#include <string>
#include <utility>

namespace solo::posix_common {

// Named, process-scoped lock: a datagram socket bound to |name|. Binding is
// atomic, so at most one live process holds a given name, and the kernel
// drops it when the holder exits or crashes.
class SingleInstanceLock {
public:
  ~SingleInstanceLock();

  SingleInstanceLock(const SingleInstanceLock&) = delete;
  SingleInstanceLock& operator=(const SingleInstanceLock&) = delete;

  SingleInstanceLock(SingleInstanceLock&& o) noexcept;
  SingleInstanceLock& operator=(SingleInstanceLock&& o) noexcept;

  // Fails with sys_errno == EADDRINUSE when another process holds |name|.
  static core::Result<SingleInstanceLock> try_acquire(std::string name);

  const std::string& name() const noexcept { return name_; }

private:
  SingleInstanceLock(FileHandle fd, std::string name, std::string fs_path)
    : fd_(std::move(fd)), name_(std::move(name)), fs_path_(std::move(fs_path)) {}

  FileHandle fd_;
  std::string name_;
  std::string fs_path_;
};

} // namespace solo::posix_common
