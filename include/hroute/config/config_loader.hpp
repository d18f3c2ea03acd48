#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader for router configuration from a YAML file (yaml-cpp).
 * @details All defaults reference named constants to avoid magic literals.
 *
 * File format (top-level mapping, every key optional):
 * @code
 *   # county router
 *   root_address: ke.go.health
 *   router_address: ke.go.health.county1
 *   log_level: info
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "hroute/compat/expected.hpp"
#include "hroute/config/constants.hpp"
#include "hroute/obs/observability.hpp"
#include "hroute/routing/address_router.hpp"

namespace hroute::config {

    /** @struct RouterConfig
     *  @brief Settings needed to stand up one router.
     */
    struct RouterConfig {
        std::string   root_address{constants::DEFAULT_ROOT_ADDRESS}; ///< Top of the hierarchy
        std::string   router_address;                                ///< This router's identity
        obs::LogLevel log_level{constants::DEFAULT_LOG_LEVEL};       ///< Stdout sink threshold
    };

    /// Reasons a configuration source is rejected.
    enum class ConfigErrc : std::uint8_t {
        Unreadable = 1,  ///< File missing or not readable
        Malformed,       ///< YAML syntax error, or the document is not a mapping
        UnknownKey,      ///< Key not recognised
        InvalidValue     ///< Value missing, not a scalar, or not acceptable for its key
    };

    /** @struct ConfigError
     *  @brief Error value with the 1-based line number (0 when not line-specific).
     */
    struct ConfigError {
        ConfigErrc  code{ConfigErrc::Unreadable};
        std::size_t line{0};
        std::string detail;

        [[nodiscard]] std::string message() const;
    };

    /** @class Loader
     *  @brief Source of router configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Configuration with every field at its named default.
        static RouterConfig defaults();

        /**
         * @brief Parse YAML configuration text. Missing keys keep their defaults;
         *        an empty document yields defaults().
         */
        static hroute_detail::expected<RouterConfig, ConfigError> parse(std::string_view text);

        /**
         * @brief Load configuration from a file.
         * @param path File path.
         * @return RouterConfig, or ConfigErrc::Unreadable if the file cannot be opened.
         */
        static hroute_detail::expected<RouterConfig, ConfigError> load_from_file(const std::string& path);
    };

    /// Build router options from a loaded configuration and an injected sink.
    routing::RouterOptions to_options(const RouterConfig& cfg, std::shared_ptr<obs::LogSink> sink);

} // namespace hroute::config
