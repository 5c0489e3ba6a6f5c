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

#include "core/dispatch.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace solo::core {

// FIFO dispatch target drained by whichever thread owns the host's main loop.
class EventQueue final : public DispatchTarget {
public:
  using Task = std::function<void()>;

  EventQueue() = default;
  ~EventQueue() override;

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  bool post(Task t) override;

  // Runs what is queued right now. Returns how many tasks ran.
  std::size_t run_pending() noexcept;

  // Waits up to |timeout| for one task and runs it. False on timeout or stop.
  bool run_one_for(std::chrono::milliseconds timeout) noexcept;

  // Wakes waiters; later posts are rejected. Queued tasks are dropped.
  void stop() noexcept;

  bool stopped() const noexcept;
  std::size_t size() const noexcept;

private:
  static void run_(Task& t) noexcept;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<Task> q_;
  bool stopping_ = false;
};

} // namespace solo::core
