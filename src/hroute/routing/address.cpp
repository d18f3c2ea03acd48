/**
* @file address.cpp
 * @brief Address grammar checks and tree helpers.
 */
#include "hroute/routing/address.hpp"
#include "hroute/config/constants.hpp"

#include <algorithm>

namespace hroute::routing {

using hroute::config::constants::ADDRESS_SEPARATOR;
using hroute::config::constants::CHANNEL_SEPARATOR;

namespace {

bool is_token_char(char c) noexcept {
    return c == '_' ||
           (c >= '0' && c <= '9') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z');
}

hroute_detail::unexpected<RouteError>
invalid(std::string_view address, std::string_view root, AddressDefect defect) {
    return hroute_detail::unexpected<RouteError>(RouteError{
        .code = RouteErrc::InvalidAddress,
        .defect = defect,
        .address = std::string(address),
        .reference = std::string(root)});
}

// First grammar defect among the tokens, None if all are well-formed.
AddressDefect token_defect(std::string_view address) {
    for (const auto token : split_tokens(address)) {
        if (token.empty()) return AddressDefect::EmptyToken;
        if (!std::all_of(token.begin(), token.end(), is_token_char)) {
            return AddressDefect::IllegalCharacter;
        }
    }
    return AddressDefect::None;
}

} // namespace

bool is_valid_token(std::string_view token) noexcept {
    return !token.empty() && std::all_of(token.begin(), token.end(), is_token_char);
}

std::vector<std::string_view> split_tokens(std::string_view address) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto dot = address.find(ADDRESS_SEPARATOR, start);
        if (dot == std::string_view::npos) {
            out.push_back(address.substr(start));
            return out;
        }
        out.push_back(address.substr(start, dot - start));
        start = dot + 1;
    }
}

bool is_ancestor_of(std::string_view ancestor, std::string_view address) noexcept {
    return address.size() > ancestor.size() &&
           address.starts_with(ancestor) &&
           address[ancestor.size()] == ADDRESS_SEPARATOR;
}

bool is_rooted_at(std::string_view address, std::string_view root) noexcept {
    return address == root || is_ancestor_of(root, address);
}

Validation validate_address(std::string_view address, std::string_view root) {
    if (address.empty())              return invalid(address, root, AddressDefect::Empty);
    if (address.size() < root.size()) return invalid(address, root, AddressDefect::TooShort);
    if (!is_rooted_at(address, root)) return invalid(address, root, AddressDefect::NotRooted);

    if (const auto defect = token_defect(address); defect != AddressDefect::None) {
        return invalid(address, root, defect);
    }
    return {};
}

Validation validate_root(std::string_view root) {
    if (root.empty()) {
        return hroute_detail::unexpected<RouteError>(RouteError{
            .code = RouteErrc::InvalidConfiguration,
            .reference = "root address"});
    }
    if (const auto defect = token_defect(root); defect != AddressDefect::None) {
        return invalid(root, root, defect);
    }
    return {};
}

std::string parent_of(std::string_view address) {
    const auto dot = address.rfind(ADDRESS_SEPARATOR);
    if (dot == std::string_view::npos) return {};
    return std::string(address.substr(0, dot));
}

std::string channel_name(std::string_view address) {
    std::string out(address);
    std::replace(out.begin(), out.end(), ADDRESS_SEPARATOR, CHANNEL_SEPARATOR);
    return out;
}

} // namespace hroute::routing
