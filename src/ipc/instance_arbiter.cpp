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

#include "ipc/instance_arbiter.hpp"

#include <cerrno>
#include <utility>

#include <spdlog/spdlog.h>

namespace solo::ipc {

InstanceArbiter& InstanceArbiter::process() {
  // Leaked on purpose: no static destructor may close a held lock.
  static InstanceArbiter* const arbiter = new InstanceArbiter();
  return *arbiter;
}

bool InstanceArbiter::try_claim(const std::string& lock_name) {
  std::lock_guard lk(mtx_);

  if (auto it = decisions_.find(lock_name); it != decisions_.end()) return it->second;

  auto lr = platform::SingleInstanceLock::try_acquire(lock_name);
  bool owner = false;
  if (lr) {
    held_.push_back(std::move(lr.value));
    owner = true;
    spdlog::debug("InstanceArbiter: {} claimed", lock_name);
  } else if (lr.st.sys_errno == EADDRINUSE) {
    spdlog::debug("InstanceArbiter: {} held by another process", lock_name);
  } else {
    // Not contended, just broken: run unguarded rather than exit.
    spdlog::warn("InstanceArbiter: {} ({}), continuing as owner", lr.st.msg, lock_name);
    owner = true;
  }

  decisions_.emplace(lock_name, owner);
  return owner;
}

std::optional<bool> InstanceArbiter::decision(const std::string& lock_name) const {
  std::lock_guard lk(mtx_);
  if (auto it = decisions_.find(lock_name); it != decisions_.end()) return it->second;
  return std::nullopt;
}

} // namespace solo::ipc
