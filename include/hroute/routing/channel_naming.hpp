#pragma once
/**
 * @file channel_naming.hpp
 * @brief Pluggable mapping from an application address to a channel name.
 * @details The messaging engine resolves channel names to delivery targets; this
 *          seam lets deployments pick another convention. Implementations must be
 *          deterministic and collision-free over valid addresses.
 */

#include <string>
#include <string_view>

#include "hroute/routing/address.hpp"

namespace hroute::routing {

    class ChannelNamer {
    public:
        virtual ~ChannelNamer() = default;

        /**
         * @brief Return the channel name for a (validated) address.
         * @param address Dot-separated application address.
         */
        virtual std::string channel_for(std::string_view address) const = 0;
    };

    /**
     * @class UnderscoreChannelNamer
     * @brief Default convention: "ke.go.health" becomes "ke_go_health".
     */
    class UnderscoreChannelNamer final : public ChannelNamer {
    public:
        std::string channel_for(std::string_view address) const override {
            return channel_name(address);
        }
    };

} // namespace hroute::routing
