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

#include "ipc/message_channel.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace solo::ipc {

namespace {

constexpr int kAcceptSliceMs = 100;
constexpr int kReadTimeoutMs = 3000;
constexpr auto kReopenBackoff = std::chrono::milliseconds(100);

} // namespace

const char* to_string(ChannelServer::State s) noexcept {
  switch (s) {
    case ChannelServer::State::Idle: return "idle";
    case ChannelServer::State::Listening: return "listening";
    case ChannelServer::State::Connected: return "connected";
    case ChannelServer::State::Closed: return "closed";
  }
  return "?";
}

core::Status send_payload(const std::string& pipe_name, const core::Payload& payload, int timeout_ms) noexcept {
  auto doc = core::encode_payload(payload);
  if (!doc) return doc.st;

  auto cr = platform::LocalConnection::connect(pipe_name, timeout_ms);
  if (!cr) return cr.st;

  auto& conn = cr.value;
  const std::span<const std::uint8_t> bytes{reinterpret_cast<const std::uint8_t*>(doc.value.data()),
                                            doc.value.size()};
  SOLO_TRY(conn.send_all(bytes));
  SOLO_TRY(conn.finish_sending());

  spdlog::debug("send_payload: {} argument(s) sent to {}", payload.size(), pipe_name);
  return core::Status::Ok();
}

ChannelServer::~ChannelServer() { stop(); }

core::Status ChannelServer::open_endpoint_() noexcept {
  std::lock_guard lk(listener_mtx_);
  if (closed_.load(std::memory_order_acquire)) return core::Status::Fail("ChannelServer: closed");

  SOLO_TRY(listener_.bind_and_listen(name_, 1));
  opened_.fetch_add(1, std::memory_order_relaxed);
  return core::Status::Ok();
}

core::Status ChannelServer::start(std::string pipe_name, std::shared_ptr<core::CallbackDispatcher> dispatcher) {
  if (!dispatcher) return core::Status::Fail("ChannelServer: no dispatcher");
  if (state() != State::Idle) return core::Status::Failf("ChannelServer: already {}", to_string(state()));

  name_ = std::move(pipe_name);
  dispatcher_ = std::move(dispatcher);

  SOLO_TRY(open_endpoint_());

  state_.store(State::Listening, std::memory_order_release);
  {
    std::lock_guard jl(join_mtx_);
    worker_ = std::jthread([this](std::stop_token st) { run_(st); });
  }

  spdlog::debug("ChannelServer: listening on {}", name_);
  return core::Status::Ok();
}

void ChannelServer::stop() noexcept {
  const bool was_closed = closed_.exchange(true, std::memory_order_acq_rel);
  if (!was_closed) {
    std::lock_guard lk(listener_mtx_);
    listener_.shutdown();
  }

  // From inside a handler running on the worker: it exits on its own.
  if (worker_id_.load(std::memory_order_acquire) == std::this_thread::get_id()) return;

  std::lock_guard jl(join_mtx_);
  if (worker_.joinable()) {
    worker_.request_stop();
    worker_.join();
  }

  {
    std::lock_guard lk(listener_mtx_);
    listener_.close();
  }
  state_.store(State::Closed, std::memory_order_release);
  if (!was_closed) spdlog::debug("ChannelServer: stopped {} after {} connection(s)", name_, connections_served());
}

void ChannelServer::run_(std::stop_token st) noexcept {
  // Set before any handler can run here and call stop().
  worker_id_.store(std::this_thread::get_id(), std::memory_order_release);

  while (!closed_.load(std::memory_order_acquire) && !st.stop_requested()) {
    if (!listener_.listening()) {
      auto os = open_endpoint_();
      if (!os) {
        if (closed_.load(std::memory_order_acquire)) break;
        spdlog::warn("ChannelServer: cannot reopen {}: {}", name_, os.msg);
        std::this_thread::sleep_for(kReopenBackoff);
        continue;
      }
    }

    auto ar = listener_.accept_one(kAcceptSliceMs);

    if (!ar) {
      if (closed_.load(std::memory_order_acquire)) break; // stop() tore the endpoint down

      spdlog::debug("ChannelServer: {} ({}), reopening endpoint", ar.st.msg, name_);
      std::lock_guard lk(listener_mtx_);
      listener_.close();
      continue;
    }
    if (!ar.value) continue;

    serve_(std::move(*ar.value));

    if (!closed_.load(std::memory_order_acquire)) state_.store(State::Listening, std::memory_order_release);
  }

  std::lock_guard lk(listener_mtx_);
  listener_.close();
  state_.store(State::Closed, std::memory_order_release);
}

void ChannelServer::serve_(platform::LocalConnection conn) noexcept {
  state_.store(State::Connected, std::memory_order_release);
  served_.fetch_add(1, std::memory_order_relaxed);

  auto uid = conn.peer_uid();
  if (!uid) {
    spdlog::debug("ChannelServer: dropping connection: {}", uid.st.msg);
    return;
  }
  if (uid.value != ::geteuid()) {
    spdlog::warn("ChannelServer: dropping connection from uid {} on {}", uid.value, name_);
    return;
  }

  conn.set_timeout_ms(kReadTimeoutMs);
  auto rr = conn.read_to_end(core::kMaxPayloadDocument);
  if (!rr) {
    spdlog::debug("ChannelServer: dropping connection: {}", rr.st.msg);
    return;
  }

  auto ds = dispatcher_->deliver(rr.value);
  if (!ds) spdlog::debug("ChannelServer: nothing delivered: {}", ds.msg);
}

} // namespace solo::ipc
