#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the address router.
 * @details These values eliminate magic literals from the codebase. Override via the
 *          Config Loader (YAML file) in deployments.
 */

#include <string_view>

#include "hroute/obs/observability.hpp"

namespace hroute::config::constants {

// =====================
// Address grammar
// =====================
/// Root of the address hierarchy unless configured otherwise.
inline constexpr std::string_view DEFAULT_ROOT_ADDRESS = "ke.go.health";
/// Token separator inside an application address.
inline constexpr char ADDRESS_SEPARATOR = '.';
/// Replacement for ADDRESS_SEPARATOR when deriving channel names.
inline constexpr char CHANNEL_SEPARATOR = '_';

// =====================
// Config file keys
// =====================
inline constexpr std::string_view KEY_ROOT_ADDRESS   = "root_address";
inline constexpr std::string_view KEY_ROUTER_ADDRESS = "router_address";
inline constexpr std::string_view KEY_LOG_LEVEL      = "log_level";

// =====================
// Logging
// =====================
/// Threshold used by the stdout sink when no level is configured.
inline constexpr obs::LogLevel DEFAULT_LOG_LEVEL = obs::LogLevel::Info;

} // namespace hroute::config::constants
