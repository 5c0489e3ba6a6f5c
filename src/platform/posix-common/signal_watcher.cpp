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

#include "signal_watcher.hpp"

#include <pthread.h>
#include <signal.h>

#include <utility>

#include <spdlog/spdlog.h>

namespace solo::posix_common {

namespace {

constexpr int kWatched[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

sigset_t watched_set() {
  sigset_t set{};
  sigemptyset(&set);
  for (int s : kWatched) sigaddset(&set, s);
  return set;
}

const char* sig_desc(int signo) {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    case SIGQUIT: return "SIGQUIT";
    default: return "SIGNAL";
  }
}

} // namespace

SignalWatcher::SignalWatcher(Callback cb) : cb_(std::move(cb)) {}

SignalWatcher::~SignalWatcher() { stop_and_restore_(); }

SignalWatcher::SignalWatcher(SignalWatcher&& o) noexcept { *this = std::move(o); }

SignalWatcher& SignalWatcher::operator=(SignalWatcher&& o) noexcept {
  if (this == &o) return *this;
  stop_and_restore_();

  cb_ = std::move(o.cb_);
  watcher_ = std::move(o.watcher_);
  active_ = std::exchange(o.active_, false);
  old_mask_ = o.old_mask_;
  have_old_mask_ = std::exchange(o.have_old_mask_, false);
  return *this;
}

void SignalWatcher::stop_and_restore_() noexcept {
  if (active_ && watcher_.joinable()) {
    watcher_.request_stop();
    // Wake the sigwait() in the watcher thread only; the signal stays blocked
    // everywhere else, so nothing else observes it.
    (void)::pthread_kill(watcher_.native_handle(), SIGTERM);
    watcher_.join();
  }
  active_ = false;

  if (have_old_mask_) {
    (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    have_old_mask_ = false;
  }
}

std::optional<SignalWatcher> SignalWatcher::enable(Callback cb) {
  ::signal(SIGPIPE, SIG_IGN);

  const sigset_t set = watched_set();
  sigset_t old{};
  if (::pthread_sigmask(SIG_BLOCK, &set, &old) != 0) {
    spdlog::warn("SignalWatcher: pthread_sigmask failed, signals keep their default action");
    return std::nullopt;
  }

  SignalWatcher sw(std::move(cb));
  sw.old_mask_ = old;
  sw.have_old_mask_ = true;

  sw.watcher_ = std::jthread([cb = sw.cb_](std::stop_token st) {
    const sigset_t waitset = watched_set();
    int count = 0;

    while (!st.stop_requested()) {
      int signo = 0;
      if (::sigwait(&waitset, &signo) != 0) continue;
      if (st.stop_requested()) break;

      ++count;
      spdlog::debug("SignalWatcher: {} (#{})", sig_desc(signo), count);
      if (cb) cb(sig_desc(signo), count);
    }
  });
  sw.active_ = true;

  return std::optional<SignalWatcher>{std::move(sw)};
}

} // namespace solo::posix_common
