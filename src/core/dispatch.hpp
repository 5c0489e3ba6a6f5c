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

#include "core/payload_codec.hpp"
#include "core/status.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

namespace solo::core {

// An execution context that runs posted work, e.g. a GUI thread or a host's
// own main loop.
class DispatchTarget {
public:
  virtual ~DispatchTarget() = default;

  // Schedules |fn| on the target. False when the target no longer runs work.
  virtual bool post(std::function<void()> fn) = 0;
};

// The calling thread's current target, installed by ScopedDispatchTarget.
std::shared_ptr<DispatchTarget> current_dispatch_target() noexcept;

class ScopedDispatchTarget {
public:
  explicit ScopedDispatchTarget(std::shared_ptr<DispatchTarget> target);
  ~ScopedDispatchTarget();

  ScopedDispatchTarget(const ScopedDispatchTarget&) = delete;
  ScopedDispatchTarget& operator=(const ScopedDispatchTarget&) = delete;

private:
  std::shared_ptr<DispatchTarget> prev_;
};

using PayloadHandler = std::function<void(const Payload&)>;

// Turns received documents into handler calls: one call per successfully
// decoded payload, on |target| when one was captured, otherwise inline on the
// receiving thread. Decoding and hand-off are serialized by one lock.
class CallbackDispatcher {
public:
  CallbackDispatcher(PayloadHandler handler, std::shared_ptr<DispatchTarget> target);

  CallbackDispatcher(const CallbackDispatcher&) = delete;
  CallbackDispatcher& operator=(const CallbackDispatcher&) = delete;

  // Fails for malformed documents, and when the target refuses the work. The
  // handler is not invoked in either case.
  Status deliver(std::string_view document);

  std::size_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }
  bool has_target() const noexcept { return static_cast<bool>(target_); }

private:
  static void invoke_(const PayloadHandler& handler, const Payload& p) noexcept;

  PayloadHandler handler_;
  std::shared_ptr<DispatchTarget> target_;

  std::mutex mtx_;
  Payload last_;
  std::atomic<std::size_t> delivered_{0};
};

} // namespace solo::core
