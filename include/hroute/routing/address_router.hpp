#pragma once
// hroute: AddressRouter
// Next-hop decision for a store-and-forward network addressed by static,
// hierarchical application addresses (e.g. "ke.go.health.county1.facility1").
// Given a destination, a router either escalates to its gateway (parent) or
// descends exactly one level into its own subtree.
//
// Runtime policy: no exceptions, no I/O besides the injected sink, no mutable state.
// Instances are immutable after create(); concurrent decide()/dispatch_to() calls on
// one instance need no synchronization as long as the sink is thread-safe.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "hroute/compat/expected.hpp"
#include "hroute/config/constants.hpp"
#include "hroute/obs/observability.hpp"
#include "hroute/routing/address.hpp"
#include "hroute/routing/channel_naming.hpp"
#include "hroute/routing/route_error.hpp"

namespace hroute::routing {

/// Direction of a single hop relative to the deciding router.
enum class RouteDirection : std::uint8_t {
    Gateway,  ///< Escalate to the parent router
    Downward  ///< Descend to an immediate child
};

/// Outcome of a successful next-hop decision.
struct RouteDecision final {
    RouteDirection direction{RouteDirection::Gateway};
    std::string    next_hop;  ///< Address of the next router
    std::string    channel;   ///< Channel name of next_hop

    bool operator==(const RouteDecision&) const = default;
};

/// Construction parameters. Null sink/namer pick the silent sink and '_' naming.
struct RouterOptions {
    std::string root_address{config::constants::DEFAULT_ROOT_ADDRESS};
    std::string router_address;
    std::shared_ptr<obs::LogSink>       sink;
    std::shared_ptr<const ChannelNamer> namer;
};

class AddressRouter final {
public:
    template <class T>
    using Result = hroute_detail::expected<T, RouteError>;

    // --------------------------- Construction --------------------------------
    /// Validate @p opts and build a router. Emits one Info line on success.
    static Result<AddressRouter> create(RouterOptions opts);

    /// Convenience: default root, optional sink.
    static Result<AddressRouter> create(std::string router_address,
                                        std::shared_ptr<obs::LogSink> sink = {});

    /// Build a fresh router with another root; this instance is left untouched.
    [[nodiscard]] Result<AddressRouter> with_root_address(std::string root_address) const;

    AddressRouter(const AddressRouter&)            = default;
    AddressRouter& operator=(const AddressRouter&) = default;
    /// A moved-from router keeps its sink and namer, has empty addresses and
    /// rejects every destination with InvalidAddress.
    AddressRouter(AddressRouter&& other) noexcept;
    AddressRouter& operator=(AddressRouter&& other) noexcept;

    // --------------------------- Decisions -----------------------------------
    /// Address validation plus SelfRoute when @p destination is this router.
    [[nodiscard]] Validation validate_destination(std::string_view destination) const;

    /// Full next-hop decision (direction, next-hop address, channel).
    [[nodiscard]] Result<RouteDecision> decide(std::string_view destination) const;

    /// Channel name of the next hop toward @p destination.
    [[nodiscard]] Result<std::string> dispatch_to(std::string_view destination) const;

    /// Parent of this router. TopLevelRouter when this router is the root.
    [[nodiscard]] Result<std::string> gateway_address() const;

    /// Channel name under this router's naming convention.
    [[nodiscard]] std::string channel_for(std::string_view address) const;

    // --------------------------- Accessors -----------------------------------
    [[nodiscard]] const std::string& root_address() const noexcept { return root_; }
    [[nodiscard]] const std::string& router_address() const noexcept { return address_; }
    [[nodiscard]] bool is_top_level() const noexcept { return address_ == root_; }
    [[nodiscard]] const std::shared_ptr<obs::LogSink>& sink() const noexcept { return sink_; }

private:
    AddressRouter(std::string root, std::string address,
                  std::shared_ptr<obs::LogSink> sink,
                  std::shared_ptr<const ChannelNamer> namer) noexcept;

    /// First router_address().size() characters of @p destination (raw, not token-aligned).
    std::string_view router_token(std::string_view destination) const noexcept;

    /// Remainder of @p destination after the router address and its separator.
    std::string_view nearby_token(std::string_view destination) const noexcept;

    /// Router address extended by the first segment of @p nearby.
    std::string nearby_address(std::string_view nearby) const;

    void info(const std::string& message) const;
    void reject(std::string_view destination, const RouteError& err) const;

private:
    std::string root_;
    std::string address_;
    std::shared_ptr<obs::LogSink>       sink_;
    std::shared_ptr<const ChannelNamer> namer_;
};

} // namespace hroute::routing
