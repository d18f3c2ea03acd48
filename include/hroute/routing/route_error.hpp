/**
 * @file route_error.hpp
 * @brief Closed set of routing failures with structured diagnostics.
 *
 * Every fallible router operation returns an expected<T, RouteError>. The
 * core never throws and never retries; callers decide whether to abort,
 * dead-letter or escalate a message based on RouteError::code.
 */
#pragma once

#include <cstdint>
#include <string>

namespace hroute::routing {

/**
 * @brief Failure categories surfaced by the router.
 *
 * @note Semantics:
 *  - InvalidConfiguration: router built with an empty identity or empty root.
 *  - InvalidAddress:       an address broke the grammar or is not under the root.
 *  - SelfRoute:            destination is the router itself (already delivered).
 *  - TopLevelRouter:       a gateway was needed but the router is the root.
 */
enum class RouteErrc : std::uint8_t {
  InvalidConfiguration = 1,
  InvalidAddress,
  SelfRoute,
  TopLevelRouter
};

/**
 * @brief Which structural rule an address broke (InvalidAddress only).
 */
enum class AddressDefect : std::uint8_t {
  None = 0,          ///< Not an address failure
  Empty,             ///< Address is the empty string
  TooShort,          ///< Fewer characters than the root address
  NotRooted,         ///< Does not start with the root on a token boundary
  EmptyToken,        ///< Leading, trailing or doubled separator
  IllegalCharacter   ///< Token contains a character outside [A-Za-z0-9_]
};

/**
 * @brief Error value carried by routing results.
 */
struct RouteError final {
  /// Failure category.
  RouteErrc code{RouteErrc::InvalidAddress};

  /// Structural defect, AddressDefect::None unless code == InvalidAddress.
  AddressDefect defect{AddressDefect::None};

  /// The offending address (destination, router or root).
  std::string address;

  /// Root address for InvalidAddress/TopLevelRouter, router address for SelfRoute,
  /// name of the missing setting for InvalidConfiguration.
  std::string reference;

  /// Human readable diagnostic suitable for logs and dead-letter reasons.
  [[nodiscard]] std::string message() const;

  bool operator==(const RouteError&) const = default;
};

/// Stable label for an error category (e.g. "self_route").
[[nodiscard]] const char* to_string(RouteErrc code) noexcept;

/// Stable label for an address defect (e.g. "empty_token").
[[nodiscard]] const char* to_string(AddressDefect defect) noexcept;

} // namespace hroute::routing
