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
#include "core/payload_codec.hpp"
#include "core/status.hpp"
#include "platform/platform_all.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace solo::ipc {

inline constexpr int kDefaultConnectTimeoutMs = 3000;

// Client role: connect to |pipe_name| within |timeout_ms|, write one payload
// document, disconnect. The result is informational; a challenger exits the
// same way whether or not the owner got the message.
core::Status send_payload(const std::string& pipe_name, const core::Payload& payload,
                          int timeout_ms = kDefaultConnectTimeoutMs) noexcept;

// Server role: a background worker that accepts one connection at a time,
// reads exactly one document from it, hands it to the dispatcher and goes
// back to waiting. The listening endpoint stays open meanwhile, so clients
// that arrive during a delivery wait in the kernel's accept backlog and are
// served after it, one by one.
//
// Must not be destroyed from inside its own payload handler.
class ChannelServer {
public:
  enum class State { Idle, Listening, Connected, Closed };

  ChannelServer() = default;
  ~ChannelServer();

  ChannelServer(const ChannelServer&) = delete;
  ChannelServer& operator=(const ChannelServer&) = delete;

  // Binds |pipe_name| on the calling thread, then starts the worker.
  core::Status start(std::string pipe_name, std::shared_ptr<core::CallbackDispatcher> dispatcher);

  // Marks the server closed, then tears the endpoint down and joins the
  // worker. Whatever failure the worker sees after that is treated as the
  // intended teardown. Idempotent.
  void stop() noexcept;

  State state() const noexcept { return state_.load(std::memory_order_acquire); }
  std::size_t connections_served() const noexcept { return served_.load(std::memory_order_relaxed); }
  std::size_t endpoints_opened() const noexcept { return opened_.load(std::memory_order_relaxed); }
  const std::string& name() const noexcept { return name_; }

private:
  friend struct ChannelServerTestAccess;

  core::Status open_endpoint_() noexcept;
  void run_(std::stop_token st) noexcept;
  void serve_(platform::LocalConnection conn) noexcept;

private:
  std::string name_;
  std::shared_ptr<core::CallbackDispatcher> dispatcher_;

  std::mutex listener_mtx_;
  platform::LocalListener listener_;

  std::atomic<State> state_{State::Idle};
  std::atomic_bool closed_{false};
  std::atomic<std::size_t> served_{0};
  std::atomic<std::size_t> opened_{0};

  std::mutex join_mtx_;
  std::atomic<std::thread::id> worker_id_{};
  std::jthread worker_;
};

const char* to_string(ChannelServer::State s) noexcept;

} // namespace solo::ipc
