/**
* @file route_error.cpp
 * @brief Labels and diagnostic rendering for RouteError.
 */
#include "hroute/routing/route_error.hpp"

namespace hroute::routing {

const char* to_string(RouteErrc code) noexcept {
    switch (code) {
        case RouteErrc::InvalidConfiguration: return "invalid_configuration";
        case RouteErrc::InvalidAddress:       return "invalid_address";
        case RouteErrc::SelfRoute:            return "self_route";
        case RouteErrc::TopLevelRouter:       return "top_level_router";
    }
    return "unknown";
}

const char* to_string(AddressDefect defect) noexcept {
    switch (defect) {
        case AddressDefect::None:             return "none";
        case AddressDefect::Empty:            return "empty";
        case AddressDefect::TooShort:         return "too_short";
        case AddressDefect::NotRooted:        return "not_rooted";
        case AddressDefect::EmptyToken:       return "empty_token";
        case AddressDefect::IllegalCharacter: return "illegal_character";
    }
    return "unknown";
}

std::string RouteError::message() const {
    switch (code) {
        case RouteErrc::InvalidConfiguration:
            return "Router cannot be initialized with an empty " + reference + ".";
        case RouteErrc::InvalidAddress:
            return "Invalid application address [" + address + "] ("
                   + to_string(defect) + "). A valid address must begin with the root token: ["
                   + reference + "]";
        case RouteErrc::SelfRoute:
            return "Invalid destination application address [" + address
                   + "]. This address points to the [" + reference + "] router address.";
        case RouteErrc::TopLevelRouter:
            return "Impossible operation. Attempting to obtain a gateway address for the "
                   "top-level router [" + reference + "]. Check destination address ["
                   + address + "].";
    }
    return "Unknown routing error for [" + address + "]";
}

} // namespace hroute::routing
