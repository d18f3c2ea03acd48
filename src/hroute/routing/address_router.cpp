// AddressRouter decision notes
// Subtree membership is decided by a raw character-length prefix ("router token"),
// not a token-aligned one: a destination that merely starts with the router's
// address text (router "a.cou", destination "a.county1") is treated as inside the
// subtree. Deployments rely on this exact rule, so it is kept as is.

#include "hroute/routing/address_router.hpp"

#include <utility>

namespace hroute::routing {

using hroute::config::constants::ADDRESS_SEPARATOR;

//------------------------------- Construction ---------------------------------

AddressRouter::AddressRouter(std::string root, std::string address,
                             std::shared_ptr<obs::LogSink> sink,
                             std::shared_ptr<const ChannelNamer> namer) noexcept
: root_(std::move(root)),
  address_(std::move(address)),
  sink_(std::move(sink)),
  namer_(std::move(namer)) {}

// Moves copy the shared sink/namer so a moved-from router never holds null pointers.
// Its addresses are cleared, which makes every later destination fail validation.
AddressRouter::AddressRouter(AddressRouter&& other) noexcept
: root_(std::move(other.root_)),
  address_(std::move(other.address_)),
  sink_(other.sink_),
  namer_(other.namer_) {
    other.root_.clear();
    other.address_.clear();
}

AddressRouter& AddressRouter::operator=(AddressRouter&& other) noexcept {
    if (this != &other) {
        root_ = std::move(other.root_);
        address_ = std::move(other.address_);
        sink_ = other.sink_;
        namer_ = other.namer_;
        other.root_.clear();
        other.address_.clear();
    }
    return *this;
}

AddressRouter::Result<AddressRouter> AddressRouter::create(RouterOptions opts) {
    if (opts.router_address.empty()) {
        return hroute_detail::unexpected<RouteError>(RouteError{
            .code = RouteErrc::InvalidConfiguration,
            .reference = "router address"});
    }
    if (auto v = validate_root(opts.root_address); !v) {
        return hroute_detail::unexpected<RouteError>(v.error());
    }
    if (auto v = validate_address(opts.router_address, opts.root_address); !v) {
        return hroute_detail::unexpected<RouteError>(v.error());
    }

    if (!opts.sink)  opts.sink  = obs::make_null_sink();
    if (!opts.namer) opts.namer = std::make_shared<UnderscoreChannelNamer>();

    AddressRouter router(std::move(opts.root_address), std::move(opts.router_address),
                         std::move(opts.sink), std::move(opts.namer));
    router.info("Initialized new router with address " + router.address_);
    return router;
}

AddressRouter::Result<AddressRouter>
AddressRouter::create(std::string router_address, std::shared_ptr<obs::LogSink> sink) {
    RouterOptions opts;
    opts.router_address = std::move(router_address);
    opts.sink = std::move(sink);
    return create(std::move(opts));
}

AddressRouter::Result<AddressRouter>
AddressRouter::with_root_address(std::string root_address) const {
    return create(RouterOptions{
        .root_address = std::move(root_address),
        .router_address = address_,
        .sink = sink_,
        .namer = namer_});
}

//------------------------------- Decisions ------------------------------------

Validation AddressRouter::validate_destination(std::string_view destination) const {
    if (auto v = validate_address(destination, root_); !v) return v;
    if (destination == address_) {
        return hroute_detail::unexpected<RouteError>(RouteError{
            .code = RouteErrc::SelfRoute,
            .address = std::string(destination),
            .reference = address_});
    }
    return {};
}

AddressRouter::Result<RouteDecision> AddressRouter::decide(std::string_view destination) const {
    if (auto v = validate_destination(destination); !v) {
        reject(destination, v.error());
        return hroute_detail::unexpected<RouteError>(v.error());
    }
    info("Dispatching to destination address: " + std::string(destination));

    bool to_gateway = destination.size() < address_.size();
    if (!to_gateway) {
        info("Destination address longer than router address. Extracting router token.");
        const auto token = router_token(destination);
        info("Router token is: " + std::string(token));
        to_gateway = (token != address_);
    } else {
        info("Destination address shorter than router address. Routing up immediately.");
    }

    RouteDecision decision;
    if (to_gateway) {
        auto gateway = gateway_address();
        if (!gateway) {
            RouteError err = gateway.error();
            err.address = std::string(destination);
            reject(destination, err);
            return hroute_detail::unexpected<RouteError>(std::move(err));
        }
        decision.direction = RouteDirection::Gateway;
        decision.next_hop = std::move(*gateway);
        decision.channel = channel_for(decision.next_hop);
        info("Routing up to: " + decision.channel);
    } else {
        const auto nearby = nearby_token(destination);
        info("Nearby token is: " + std::string(nearby));
        decision.direction = RouteDirection::Downward;
        decision.next_hop = nearby_address(nearby);
        info("Nearby address is: " + decision.next_hop);
        decision.channel = channel_for(decision.next_hop);
        info("Routing down to: " + decision.channel);
    }

    sink_->record(obs::DecisionEvent{
        .router = address_,
        .destination = std::string(destination),
        .next_hop = decision.next_hop,
        .channel = decision.channel,
        .reason = decision.direction == RouteDirection::Gateway ? "gateway" : "downward"});
    return decision;
}

AddressRouter::Result<std::string> AddressRouter::dispatch_to(std::string_view destination) const {
    auto decision = decide(destination);
    if (!decision) return hroute_detail::unexpected<RouteError>(decision.error());
    return std::move(decision->channel);
}

AddressRouter::Result<std::string> AddressRouter::gateway_address() const {
    if (is_top_level()) {
        return hroute_detail::unexpected<RouteError>(RouteError{
            .code = RouteErrc::TopLevelRouter,
            .address = address_,
            .reference = root_});
    }
    return parent_of(address_);
}

std::string AddressRouter::channel_for(std::string_view address) const {
    return namer_->channel_for(address);
}

//------------------------------- Helpers --------------------------------------

std::string_view AddressRouter::router_token(std::string_view destination) const noexcept {
    return destination.substr(0, address_.size());
}

std::string_view AddressRouter::nearby_token(std::string_view destination) const noexcept {
    // destination is strictly longer than address_ here (equal length means SelfRoute).
    return destination.substr(address_.size() + 1);
}

std::string AddressRouter::nearby_address(std::string_view nearby) const {
    const auto first = nearby.substr(0, nearby.find(ADDRESS_SEPARATOR));
    std::string out;
    out.reserve(address_.size() + 1 + first.size());
    out.append(address_).push_back(ADDRESS_SEPARATOR);
    out.append(first);
    return out;
}

void AddressRouter::info(const std::string& message) const {
    sink_->log(obs::LogLevel::Info, message);
}

void AddressRouter::reject(std::string_view destination, const RouteError& err) const {
    sink_->log(obs::LogLevel::Warn, err.message());
    sink_->record(obs::DecisionEvent{
        .router = address_,
        .destination = std::string(destination),
        .reason = to_string(err.code),
        .rejected = true});
}

} // namespace hroute::routing
