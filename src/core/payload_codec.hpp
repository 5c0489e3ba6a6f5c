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

#include "core/status.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace solo::core {

// One forwarded invocation: argv of the challenger, argv[0] included.
using Payload = std::vector<std::string>;

// Upper bound for one wire document, both directions.
inline constexpr std::size_t kMaxPayloadDocument = 1024u * 1024u;

// Serializes |args| into a self-describing XML document:
//
//   <Payload><CommandLineArguments>
//     <string>arg0</string>...
//   </CommandLineArguments></Payload>
//
// Order and count are preserved, the empty list included. Fails for
// arguments containing NUL and for documents above kMaxPayloadDocument.
Result<std::string> encode_payload(const Payload& args) noexcept;

// Inverse of encode_payload. Anything that is not exactly the document shape
// above is rejected.
Result<Payload> decode_payload(std::string_view document) noexcept;

} // namespace solo::core
