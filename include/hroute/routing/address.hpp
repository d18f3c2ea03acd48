/**
 * @file address.hpp
 * @brief Hierarchical application address grammar and pure helpers.
 *
 * An address is a dot-separated sequence of tokens, each matching
 * [A-Za-z0-9_]+, written reverse-domain style (e.g. "ke.go.health.county1").
 * Addresses form a rooted tree: A is an ancestor of B iff B's token sequence
 * starts with A's full token sequence.
 *
 * All functions here are allocation-light, non-throwing (apart from string
 * allocation) and safe to call concurrently.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hroute/compat/expected.hpp"
#include "hroute/routing/route_error.hpp"

namespace hroute::routing {

/// Result of a validation step: empty on success, RouteError otherwise.
using Validation = hroute_detail::expected<void, RouteError>;

/// True iff @p token is non-empty and every character is in [A-Za-z0-9_].
[[nodiscard]] bool is_valid_token(std::string_view token) noexcept;

/**
 * @brief Split an address on the separator.
 *
 * Empty tokens are kept ("a..b" yields {"a", "", "b"}, "a." yields {"a", ""})
 * so that validation can reject them. Views point into @p address.
 */
[[nodiscard]] std::vector<std::string_view> split_tokens(std::string_view address);

/// Strict token-aligned ancestor test: @p address lies below @p ancestor.
[[nodiscard]] bool is_ancestor_of(std::string_view ancestor, std::string_view address) noexcept;

/// Token-aligned rooting: @p address equals @p root or lies below it.
[[nodiscard]] bool is_rooted_at(std::string_view address, std::string_view root) noexcept;

/**
 * @brief Validate @p address against @p root.
 *
 * Rules, reported in this order:
 *  1. non-empty, and at least as long as the root;
 *  2. rooted at @p root on a token boundary;
 *  3. every token non-empty and within [A-Za-z0-9_].
 *
 * @return RouteErrc::InvalidAddress carrying the address, the root and the defect.
 */
[[nodiscard]] Validation validate_address(std::string_view address, std::string_view root);

/**
 * @brief Validate a root address on its own.
 * @return InvalidConfiguration if empty, InvalidAddress if any token is malformed.
 */
[[nodiscard]] Validation validate_root(std::string_view root);

/// Parent address (last token removed). Empty for a single-token address.
[[nodiscard]] std::string parent_of(std::string_view address);

/// Channel name derived from an address: every '.' replaced with '_'.
[[nodiscard]] std::string channel_name(std::string_view address);

} // namespace hroute::routing
