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

#include "core/dispatch.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace solo::core {

namespace {
thread_local std::shared_ptr<DispatchTarget> t_current;
} // namespace

std::shared_ptr<DispatchTarget> current_dispatch_target() noexcept { return t_current; }

ScopedDispatchTarget::ScopedDispatchTarget(std::shared_ptr<DispatchTarget> target)
  : prev_(std::exchange(t_current, std::move(target))) {}

ScopedDispatchTarget::~ScopedDispatchTarget() { t_current = std::move(prev_); }

CallbackDispatcher::CallbackDispatcher(PayloadHandler handler, std::shared_ptr<DispatchTarget> target)
  : handler_(std::move(handler))
  , target_(std::move(target)) {}

void CallbackDispatcher::invoke_(const PayloadHandler& handler, const Payload& p) noexcept {
  try {
    handler(p);
  } catch (const std::exception& e) {
    spdlog::error("payload handler threw: {}", e.what());
  } catch (...) {
    spdlog::error("payload handler threw unknown exception");
  }
}

Status CallbackDispatcher::deliver(std::string_view document) {
  std::lock_guard lk(mtx_);

  auto dr = decode_payload(document);
  if (!dr) return dr.st;
  last_ = std::move(dr.value);

  if (target_) {
    // The posted call may outlive this dispatcher, so it owns its copies.
    if (!target_->post([handler = handler_, p = last_] { invoke_(handler, p); })) {
      return Status::Fail("dispatch target no longer accepts work");
    }
  } else {
    invoke_(handler_, last_);
  }

  delivered_.fetch_add(1, std::memory_order_relaxed);
  return Status::Ok();
}

} // namespace solo::core
