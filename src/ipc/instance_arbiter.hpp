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

#include "platform/platform_all.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace solo::ipc {

// Decides once per process and lock name whether this process owns the name.
//
// There is deliberately no release: a won lock stays held until the process
// exits or crashes and the kernel drops it. The process-wide arbiter is never
// destroyed for that reason.
class InstanceArbiter {
public:
  static InstanceArbiter& process();

  InstanceArbiter(const InstanceArbiter&) = delete;
  InstanceArbiter& operator=(const InstanceArbiter&) = delete;

  // True iff this process acquired |lock_name|. Only the first call per name
  // touches the OS; later calls return the cached decision.
  bool try_claim(const std::string& lock_name);

  // Cached decision for |lock_name|, nullopt if try_claim was never called.
  std::optional<bool> decision(const std::string& lock_name) const;

private:
  InstanceArbiter() = default;
  ~InstanceArbiter() = default;

  mutable std::mutex mtx_;
  std::unordered_map<std::string, bool> decisions_;
  std::vector<platform::SingleInstanceLock> held_;
};

} // namespace solo::ipc
