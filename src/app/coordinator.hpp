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
#include "core/identity.hpp"
#include "core/payload_codec.hpp"
#include "core/status.hpp"
#include "ipc/message_channel.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace solo::app {

struct Config {
  // Replaces the default identity (hash of the executable path).
  std::optional<std::string> unique_name;

  int connect_timeout_ms = ipc::kDefaultConnectTimeoutMs;

  // Where forwarded invocations are delivered. When null, the calling thread's
  // current target (see core::ScopedDispatchTarget) is captured at launch, and
  // without one the handler runs on the channel's worker thread.
  std::shared_ptr<core::DispatchTarget> dispatch_target;
};

// Glues identity, ownership, channel and dispatch together. Create exactly
// one per process and keep it for the life of the process.
class Coordinator {
public:
  static core::Result<std::unique_ptr<Coordinator>> create(Config cfg = {});

  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Only before the identity is first used.
  core::Status set_unique_name(std::string name);

  // Resolves the identity and freezes it.
  core::Result<std::string> unique_name();

  // True: this process owns the identity and now listens for forwarded
  // invocations; carry on. False: another instance owns it and |args| went to
  // that instance; exit now.
  //
  // The decision is made once. Later calls return it without listening or
  // sending again. Throws std::invalid_argument for an empty handler.
  bool launch_or_return(core::PayloadHandler on_payload, core::Payload args);

  // Same, forwarding this process's own command line.
  bool launch_or_return(core::PayloadHandler on_payload);

  bool is_owner() const noexcept;

  // Stops accepting forwarded invocations. Ownership is kept until exit.
  void stop_listening() noexcept;

  const ipc::ChannelServer& server() const noexcept { return server_; }

private:
  explicit Coordinator(Config cfg);

  core::Result<std::string> freeze_identity_();

private:
  Config cfg_;

  mutable std::mutex mtx_;
  bool identity_frozen_ = false;
  std::string identity_;
  core::EndpointNames names_;
  std::optional<bool> owner_;

  std::shared_ptr<core::CallbackDispatcher> dispatcher_;
  ipc::ChannelServer server_;
};

// argv of the running process, argv[0] included.
core::Result<core::Payload> process_command_line() noexcept;

} // namespace solo::app
