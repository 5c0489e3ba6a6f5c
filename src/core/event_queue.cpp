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

#include "core/event_queue.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace solo::core {

EventQueue::~EventQueue() { stop(); }

bool EventQueue::post(Task t) {
  if (!t) return true;
  {
    std::lock_guard lk(mtx_);
    if (stopping_) {
      spdlog::debug("EventQueue: post on stopped queue");
      return false;
    }
    q_.push(std::move(t));
  }
  cv_.notify_one();
  return true;
}

void EventQueue::stop() noexcept {
  {
    std::lock_guard lk(mtx_);
    stopping_ = true;
    std::queue<Task>().swap(q_);
  }
  cv_.notify_all();
}

bool EventQueue::stopped() const noexcept {
  std::lock_guard lk(mtx_);
  return stopping_;
}

std::size_t EventQueue::size() const noexcept {
  std::lock_guard lk(mtx_);
  return q_.size();
}

void EventQueue::run_(Task& t) noexcept {
  try {
    t();
  } catch (const std::exception& e) {
    spdlog::error("EventQueue task threw: {}", e.what());
  } catch (...) {
    spdlog::error("EventQueue task threw unknown exception");
  }
}

std::size_t EventQueue::run_pending() noexcept {
  std::queue<Task> batch;
  {
    std::lock_guard lk(mtx_);
    batch.swap(q_);
  }

  std::size_t n = 0;
  for (; !batch.empty(); batch.pop(), ++n) run_(batch.front());
  return n;
}

bool EventQueue::run_one_for(std::chrono::milliseconds timeout) noexcept {
  Task task;
  {
    std::unique_lock lk(mtx_);
    if (!cv_.wait_for(lk, timeout, [&] { return stopping_ || !q_.empty(); })) return false;
    if (q_.empty()) return false;

    task = std::move(q_.front());
    q_.pop();
  }

  run_(task);
  return true;
}

} // namespace solo::core
