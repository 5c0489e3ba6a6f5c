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

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace solo::core {

struct Status {
  bool ok = true;
  std::string msg;
  int sys_errno = 0; // errno of the failing syscall, 0 if not a syscall failure

  Status() = default;
  Status(bool ok_, std::string msg_, int errno_ = 0) : ok(ok_), msg(std::move(msg_)), sys_errno(errno_) {}

  static Status Ok() { return {}; }

  static Status Fail(std::string msg) { return Status(false, std::move(msg)); }

  template <class... Args>
  static Status Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  // "<what>: <strerror(e)>", keeping e for callers that classify on it.
  static Status Errno(std::string_view what, int e) {
    return Status(false, fmt::format("{}: {}", what, std::strerror(e)), e);
  }

  explicit operator bool() const noexcept { return ok; }
};

// Value or failure. On failure |st| carries the reason and |value| is not
// constructed; read |value| only after checking the result.
template <class T>
struct Result {
  Status st{false, {}};
  bool has_value = false;

  struct Empty { };
  union {
    Empty empty;
    T value;
  };

  Result() noexcept : empty{} {}
  ~Result() { reset_(); }

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  Result(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : empty{} { steal_(o); }

  Result& operator=(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) {
    if (this != &o) {
      reset_();
      steal_(o);
    }
    return *this;
  }

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    r.emplace_(std::move(v));
    return r;
  }

  static Result Fail(Status st) {
    Result r;
    r.st = std::move(st);
    r.st.ok = false;
    return r;
  }

  static Result Fail(std::string msg) { return Fail(Status::Fail(std::move(msg))); }

  template <class... Args>
  static Result Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  static Result Errno(std::string_view what, int e) { return Fail(Status::Errno(what, e)); }

  explicit operator bool() const noexcept { return st.ok; }

private:
  void emplace_(T&& v) {
    ::new (static_cast<void*>(std::addressof(value))) T(std::move(v));
    has_value = true;
  }

  void steal_(Result& o) {
    st = std::move(o.st);
    if (o.has_value) {
      emplace_(std::move(o.value));
      o.reset_();
    }
  }

  void reset_() noexcept {
    if (has_value) {
      value.~T();
      has_value = false;
    }
  }
};

} // namespace solo::core

#define SOLO_TRY(expr) do { auto _st = (expr); if (!_st.ok) return _st; } while (0)
