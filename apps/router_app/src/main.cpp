/**
 * @file main.cpp
 * @brief router_app: resolve the next-hop channel for one destination.
 *
 * Usage:
 *   router_app [--config FILE] [--root ROOT] [--log-level LEVEL] [ROUTER_ADDRESS DESTINATION]
 *
 * With no positional arguments the router address comes from the config file;
 * with neither, a root-level router dispatches a sample destination.
 * Prints the channel name on stdout.
 *
 * Exit codes: 0 success, 1 routing error, 2 usage or configuration error.
 */

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hroute/config/config_loader.hpp"
#include "hroute/obs/observability.hpp"
#include "hroute/routing/address_router.hpp"
#include "hroute/version.hpp"

namespace {

constexpr int kExitRouting = 1;
constexpr int kExitUsage   = 2;

constexpr std::string_view kSampleDestination = "ke.go.health.ouch.nyef";

void usage(std::ostream& os) {
  os << "hroute router_app " << hroute::version_string << "\n"
     << "usage: router_app [--config FILE] [--root ROOT] [--log-level LEVEL]"
        " [ROUTER_ADDRESS DESTINATION]\n";
}

} // namespace

int main(int argc, char** argv) {
  using hroute::config::Loader;

  std::string config_path, root_override, level_override;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool has_value = (i + 1 < argc);
    if (arg == "-h" || arg == "--help") { usage(std::cout); return 0; }
    if ((arg == "--config" || arg == "--root" || arg == "--log-level") && !has_value) {
      std::cerr << "missing value for " << arg << "\n";
      usage(std::cerr);
      return kExitUsage;
    }
    if (arg == "--config")         config_path = argv[++i];
    else if (arg == "--root")      root_override = argv[++i];
    else if (arg == "--log-level") level_override = argv[++i];
    else                           positional.emplace_back(arg);
  }
  if (positional.size() != 0 && positional.size() != 2) {
    usage(std::cerr);
    return kExitUsage;
  }

  hroute::config::RouterConfig cfg = Loader::defaults();
  if (!config_path.empty()) {
    auto loaded = Loader::load_from_file(config_path);
    if (!loaded) {
      std::cerr << loaded.error().message() << "\n";
      return kExitUsage;
    }
    cfg = std::move(*loaded);
  }
  if (!root_override.empty()) cfg.root_address = root_override;
  if (!level_override.empty()) {
    const auto level = hroute::obs::parse_log_level(level_override);
    if (!level) {
      std::cerr << "invalid log level '" << level_override << "'\n";
      return kExitUsage;
    }
    cfg.log_level = *level;
  }

  std::string destination;
  if (positional.size() == 2) {
    cfg.router_address = positional[0];
    destination = positional[1];
  } else {
    if (cfg.router_address.empty()) cfg.router_address = cfg.root_address;
    destination = std::string(kSampleDestination);
  }

  auto sink = hroute::obs::make_stdout_sink(cfg.log_level);
  auto router = hroute::routing::AddressRouter::create(hroute::config::to_options(cfg, sink));
  if (!router) {
    std::cerr << router.error().message() << "\n";
    return kExitUsage;
  }

  auto channel = router->dispatch_to(destination);
  if (!channel) {
    std::cerr << channel.error().message() << "\n";
    return kExitRouting;
  }
  std::cout << *channel << std::endl;
  return 0;
}
