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

#include "app/cli.hpp"
#include "app/coordinator.hpp"
#include "app/version.hpp"
#include "core/event_queue.hpp"
#include "platform/platform_all.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try {
    auto opt = solo::app::parse_cli(argc, argv);
    if (!opt) {
      spdlog::error("{}. Use --help to see usage.", opt.st.msg);
      return EXIT_FAILURE;
    }
    if (opt.value.help) {
      spdlog::info(solo::app::usage_text());
      return EXIT_SUCCESS;
    }
    if (opt.value.version) {
      spdlog::info("solo v{}", solo::app::solo_version());
      return EXIT_SUCCESS;
    }

    auto queue = std::make_shared<solo::core::EventQueue>();
    // Before any other thread exists, so the channel worker inherits the mask.
    auto watcher = solo::platform::SignalWatcher::enable([&](const char* desc, int count) {
      spdlog::warn("Received {} ({}), shutting down", desc, count);
      queue->stop();
    });
    if (!watcher) spdlog::warn("Signal handling unavailable; Ctrl-C terminates without cleanup");

    solo::app::Config cfg;
    cfg.connect_timeout_ms = opt.value.timeout_ms;
    cfg.dispatch_target = queue;
    if (opt.value.unique_name) {
      cfg.unique_name = *opt.value.unique_name;
    } else if (const char* env = std::getenv("SOLO_UNIQUE_NAME"); env && *env) {
      cfg.unique_name = std::string(env);
    }

    auto cr = solo::app::Coordinator::create(std::move(cfg));
    if (!cr) {
      spdlog::error("{}", cr.st.msg);
      return EXIT_FAILURE;
    }
    auto& coord = *cr.value;

    solo::core::Payload own;
    own.emplace_back(argc > 0 ? argv[0] : "solo-demo");
    own.insert(own.end(), opt.value.app_args.begin(), opt.value.app_args.end());

    std::size_t received = 0;
    const std::size_t limit = opt.value.max_invocations;

    const bool owner = coord.launch_or_return([&](const solo::core::Payload& p) {
      ++received;
      spdlog::info("Invocation #{}: {}", received, fmt::join(p, " "));
      if (limit && received >= limit) {
        spdlog::info("Reached {} invocation(s), exiting", limit);
        coord.stop_listening();
        queue->stop();
      }
    }, own);

    if (!owner) {
      spdlog::info("Another instance is already running; handed over {} argument(s)", own.size());
      return EXIT_SUCCESS;
    }

    auto name = coord.unique_name();
    spdlog::info("Running as the primary instance of {}", name ? name.value : std::string("<unnamed>"));
    if (opt.value.app_args.size()) spdlog::info("Own arguments: {}", fmt::join(opt.value.app_args, " "));

    while (!queue->stopped()) {
      queue->run_one_for(std::chrono::milliseconds(250));
    }

    coord.stop_listening();
    spdlog::info("Served {} forwarded invocation(s)", coord.server().connections_served());
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    spdlog::error(e.what());
    return EXIT_FAILURE;
  }
}
