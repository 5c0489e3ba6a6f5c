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

#include "core/payload_codec.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <spdlog/spdlog.h>

namespace solo::core {

namespace pt = boost::property_tree;

namespace {

constexpr const char* kRootKey = "Payload";
constexpr const char* kListKey = "CommandLineArguments";
constexpr const char* kItemKey = "string";
constexpr const char* kAttrKey = "<xmlattr>";

const pt::ptree* only_child(const pt::ptree& node, const char* key) {
  const pt::ptree* found = nullptr;
  for (const auto& [k, child] : node) {
    if (k == kAttrKey) continue;
    if (k != key || found) return nullptr;
    found = &child;
  }
  return found;
}

} // namespace

Result<std::string> encode_payload(const Payload& args) noexcept {
  try {
    pt::ptree list;
    for (const auto& a : args) {
      if (a.find('\0') != std::string::npos) return Result<std::string>::Fail("payload: argument contains NUL");
      list.push_back(std::make_pair(kItemKey, pt::ptree(a)));
    }

    pt::ptree root;
    root.put_child(fmt::format("{}.{}", kRootKey, kListKey), list);

    std::ostringstream out;
    pt::write_xml(out, root);
    std::string doc = out.str();

    if (doc.size() > kMaxPayloadDocument) {
      return Result<std::string>::Failf("payload: document too large ({} bytes)", doc.size());
    }
    return Result<std::string>::Ok(std::move(doc));
  } catch (const std::exception& e) {
    return Result<std::string>::Failf("payload: encode: {}", e.what());
  }
}

Result<Payload> decode_payload(std::string_view document) noexcept {
  if (document.size() > kMaxPayloadDocument) {
    return Result<Payload>::Failf("payload: document too large ({} bytes)", document.size());
  }

  try {
    pt::ptree root;
    std::istringstream in{std::string(document)};
    pt::read_xml(in, root, pt::xml_parser::no_comments);

    const pt::ptree* payload = only_child(root, kRootKey);
    if (!payload) return Result<Payload>::Fail("payload: missing <Payload> root");

    const pt::ptree* list = only_child(*payload, kListKey);
    if (!list) return Result<Payload>::Fail("payload: missing <CommandLineArguments>");

    Payload out;
    out.reserve(list->size());
    for (const auto& [k, item] : *list) {
      if (k == kAttrKey) continue;
      if (k != kItemKey) return Result<Payload>::Failf("payload: unexpected element <{}>", k);
      if (!item.empty()) return Result<Payload>::Fail("payload: <string> must not have children");
      out.push_back(item.data());
    }

    spdlog::debug("payload: decoded {} argument(s)", out.size());
    return Result<Payload>::Ok(std::move(out));
  } catch (const pt::xml_parser_error& e) {
    return Result<Payload>::Failf("payload: malformed document: {}", e.what());
  } catch (const std::exception& e) {
    return Result<Payload>::Failf("payload: decode: {}", e.what());
  }
}

} // namespace solo::core
