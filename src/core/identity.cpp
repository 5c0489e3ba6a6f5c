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

#include "core/identity.hpp"
#include "platform/posix-common/local_address.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <openssl/evp.h>

#include <pwd.h>
#include <unistd.h>

#if defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

#include <spdlog/spdlog.h>

namespace solo::core {

std::string sha256_text(std::string_view bytes) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int md_len = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1) {
    // Only fails on allocation failure inside libcrypto.
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }

  // 4 output chars per 3 input bytes, plus the terminator EVP_EncodeBlock writes.
  std::array<unsigned char, ((EVP_MAX_MD_SIZE + 2) / 3) * 4 + 1> b64{};
  const int n = EVP_EncodeBlock(b64.data(), md.data(), static_cast<int>(md_len));

  std::string out(reinterpret_cast<const char*>(b64.data()), static_cast<std::size_t>(n));
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

std::string unique_name_for_path(const std::filesystem::path& exe) {
  return sha256_text(exe.string());
}

Result<std::filesystem::path> current_executable_path() noexcept {
  std::error_code ec;
  std::filesystem::path p;

#if defined(__linux__)
  p = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) return Result<std::filesystem::path>::Errno("readlink(/proc/self/exe)", ec.value());
#elif defined(__APPLE__)
  std::uint32_t size = 0;
  (void)_NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size + 1, '\0');
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    return Result<std::filesystem::path>::Fail("_NSGetExecutablePath failed");
  }
  p = std::filesystem::path(buf.data());
#else
  #error "Unsupported platform for current_executable_path"
#endif

  auto canon = std::filesystem::weakly_canonical(p, ec);
  if (ec) {
    spdlog::debug("identity: cannot canonicalize {}: {}", p.string(), ec.message());
    return Result<std::filesystem::path>::Ok(std::move(p));
  }
  return Result<std::filesystem::path>::Ok(std::move(canon));
}

Result<std::string> default_unique_name() noexcept {
  auto exe = current_executable_path();
  if (!exe) return Result<std::string>::Fail(std::move(exe.st));

  try {
    auto name = unique_name_for_path(exe.value);
    spdlog::debug("identity: {} -> {}", exe.value.string(), name);
    return Result<std::string>::Ok(std::move(name));
  } catch (const std::exception& e) {
    return Result<std::string>::Fail(e.what());
  }
}

std::string domain_name() {
  std::array<char, 256> host{};
  if (::gethostname(host.data(), host.size() - 1) != 0 || host[0] == '\0') {
    spdlog::debug("identity: gethostname: {}", std::strerror(errno));
    return "localhost";
  }
  return host.data();
}

std::string user_name() {
  const uid_t uid = ::geteuid();

  long bufsz = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  if (bufsz <= 0) bufsz = 16384;
  std::vector<char> buf(static_cast<std::size_t>(bufsz));

  passwd pw{};
  passwd* found = nullptr;
  const int rc = ::getpwuid_r(uid, &pw, buf.data(), buf.size(), &found);
  if (rc == 0 && found && found->pw_name && *found->pw_name) return found->pw_name;

  if (const char* env = std::getenv("USER"); env && *env) return env;
  return std::to_string(uid);
}

std::size_t max_endpoint_name() { return solo::posix_common::max_local_name(); }

namespace {

std::string fit_endpoint_name(std::string_view prefix, std::string full) {
  if (full.size() <= max_endpoint_name()) return full;
  // Too long for a socket name. Collapse to a digest of the full name, which
  // keeps the user/machine/identity scoping.
  std::string fitted = fmt::format("{}_{}", prefix, sha256_text(full));
  spdlog::debug("identity: endpoint name {} too long ({} bytes), using {}", prefix, full.size(), fitted);
  return fitted;
}

} // namespace

EndpointNames EndpointNames::for_identity(std::string_view identity) {
  return for_identity(identity, domain_name(), user_name());
}

EndpointNames EndpointNames::for_identity(std::string_view identity, std::string_view domain, std::string_view user) {
  EndpointNames n;
  n.mutex = fit_endpoint_name("Mutex", fmt::format("Mutex_{}_{}_{}", domain, user, identity));
  n.pipe = fit_endpoint_name("Pipe", fmt::format("Pipe_{}_{}_{}", domain, user, identity));
  return n;
}

} // namespace solo::core
