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

#include "app/coordinator.hpp"
#include "ipc/instance_arbiter.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#if defined(__APPLE__)
  #include <crt_externs.h>
#endif

#include <spdlog/spdlog.h>

namespace solo::app {

core::Result<std::unique_ptr<Coordinator>> Coordinator::create(Config cfg) {
  using R = core::Result<std::unique_ptr<Coordinator>>;

  if (cfg.connect_timeout_ms <= 0) return R::Failf("connect timeout must be positive, got {}", cfg.connect_timeout_ms);
  if (cfg.unique_name && cfg.unique_name->empty()) return R::Fail("unique name must not be empty");

  return R::Ok(std::unique_ptr<Coordinator>(new Coordinator(std::move(cfg))));
}

Coordinator::Coordinator(Config cfg) : cfg_(std::move(cfg)) {}

Coordinator::~Coordinator() { server_.stop(); }

core::Status Coordinator::set_unique_name(std::string name) {
  if (name.empty()) return core::Status::Fail("unique name must not be empty");

  std::lock_guard lk(mtx_);
  if (identity_frozen_) {
    return core::Status::Failf("unique name already in use ({}), cannot change it to {}", identity_, name);
  }
  cfg_.unique_name = std::move(name);
  return core::Status::Ok();
}

core::Result<std::string> Coordinator::unique_name() {
  std::lock_guard lk(mtx_);
  return freeze_identity_();
}

core::Result<std::string> Coordinator::freeze_identity_() {
  using R = core::Result<std::string>;
  if (identity_frozen_) return R::Ok(identity_);

  if (cfg_.unique_name) {
    identity_ = *cfg_.unique_name;
  } else {
    auto dr = core::default_unique_name();
    if (!dr) return R::Fail(std::move(dr.st));
    identity_ = std::move(dr.value);
  }

  names_ = core::EndpointNames::for_identity(identity_);
  identity_frozen_ = true;
  spdlog::debug("Coordinator: identity {} (lock {}, channel {})", identity_, names_.mutex, names_.pipe);
  return R::Ok(identity_);
}

bool Coordinator::launch_or_return(core::PayloadHandler on_payload, core::Payload args) {
  if (!on_payload) throw std::invalid_argument("launch_or_return: payload handler is empty");

  std::lock_guard lk(mtx_);
  if (owner_) return *owner_;

  auto id = freeze_identity_();
  if (!id) {
    spdlog::error("Coordinator: no identity ({}), running without single-instance guard", id.st.msg);
    owner_ = true;
    return true;
  }

  owner_ = ipc::InstanceArbiter::process().try_claim(names_.mutex);

  if (*owner_) {
    auto target = cfg_.dispatch_target ? cfg_.dispatch_target : core::current_dispatch_target();
    dispatcher_ = std::make_shared<core::CallbackDispatcher>(std::move(on_payload), std::move(target));

    auto st = server_.start(names_.pipe, dispatcher_);
    if (!st) spdlog::warn("Coordinator: not accepting forwarded invocations: {}", st.msg);
    return true;
  }

  auto st = ipc::send_payload(names_.pipe, args, cfg_.connect_timeout_ms);
  if (!st) {
    spdlog::debug("Coordinator: invocation not forwarded: {}", st.msg);
  } else {
    spdlog::debug("Coordinator: invocation forwarded to running instance");
  }
  return false;
}

bool Coordinator::launch_or_return(core::PayloadHandler on_payload) {
  auto cl = process_command_line();
  if (!cl) {
    spdlog::debug("Coordinator: {}; forwarding an empty command line", cl.st.msg);
    return launch_or_return(std::move(on_payload), core::Payload{});
  }
  return launch_or_return(std::move(on_payload), std::move(cl.value));
}

bool Coordinator::is_owner() const noexcept {
  std::lock_guard lk(mtx_);
  return owner_.value_or(false);
}

void Coordinator::stop_listening() noexcept { server_.stop(); }

core::Result<core::Payload> process_command_line() noexcept {
  using R = core::Result<core::Payload>;

#if defined(__linux__)
  std::ifstream in("/proc/self/cmdline", std::ios::binary);
  if (!in.is_open()) return R::Fail("cannot open /proc/self/cmdline");

  const std::string raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

  core::Payload args;
  std::size_t start = 0;
  while (start < raw.size()) {
    std::size_t end = raw.find('\0', start);
    if (end == std::string::npos) end = raw.size();
    args.emplace_back(raw, start, end - start);
    start = end + 1;
  }
  return R::Ok(std::move(args));
#elif defined(__APPLE__)
  const int argc = *_NSGetArgc();
  char** argv = *_NSGetArgv();
  return R::Ok(core::Payload(argv, argv + argc));
#else
  #error "process_command_line not implemented on this platform"
#endif
}

} // namespace solo::app
