/**
 * @file config_loader.cpp
 * @brief YAML (yaml-cpp) loader for RouterConfig.
 * @details yaml-cpp reports problems by throwing; they are caught here and returned
 *          as ConfigError so callers only deal with expected<>.
 */
#include "hroute/config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

namespace hroute::config {
    using namespace hroute::config::constants;

    namespace {

    hroute_detail::unexpected<ConfigError>
    fail(ConfigErrc code, std::size_t line, std::string detail) {
        return hroute_detail::unexpected<ConfigError>(ConfigError{code, line, std::move(detail)});
    }

    // 1-based line of a node; 0 when yaml-cpp has no position for it.
    std::size_t line_of(const YAML::Mark& mark) noexcept {
        return mark.is_null() ? 0 : static_cast<std::size_t>(mark.line) + 1;
    }

    hroute_detail::expected<RouterConfig, ConfigError> from_node(const YAML::Node& doc) {
        RouterConfig rc = Loader::defaults();
        if (!doc || doc.IsNull()) return rc;
        if (!doc.IsMap()) {
            return fail(ConfigErrc::Malformed, line_of(doc.Mark()), "top-level node is not a mapping");
        }

        for (const auto& kv : doc) {
            const auto key  = kv.first.as<std::string>();
            const auto line = line_of(kv.first.Mark());
            const YAML::Node& value = kv.second;

            if (key != KEY_ROOT_ADDRESS && key != KEY_ROUTER_ADDRESS && key != KEY_LOG_LEVEL) {
                return fail(ConfigErrc::UnknownKey, line, key);
            }
            if (!value.IsScalar()) {
                return fail(ConfigErrc::InvalidValue, line, "for " + key + " (expected a scalar)");
            }
            const auto text = value.Scalar();

            if (key == KEY_ROOT_ADDRESS) {
                rc.root_address = text;
            } else if (key == KEY_ROUTER_ADDRESS) {
                rc.router_address = text;
            } else {
                const auto level = obs::parse_log_level(text);
                if (!level) return fail(ConfigErrc::InvalidValue, line, "'" + text + "' for " + key);
                rc.log_level = *level;
            }
        }
        return rc;
    }

    } // namespace

    std::string ConfigError::message() const {
        std::string where = line ? ("line " + std::to_string(line) + ": ") : std::string{};
        switch (code) {
            case ConfigErrc::Unreadable:   return "cannot read config file " + detail;
            case ConfigErrc::Malformed:    return where + "malformed config: " + detail;
            case ConfigErrc::UnknownKey:   return where + "unknown key '" + detail + "'";
            case ConfigErrc::InvalidValue: return where + "invalid value " + detail;
        }
        return where + detail;
    }

    RouterConfig Loader::defaults() {
        return RouterConfig{};
    }

    hroute_detail::expected<RouterConfig, ConfigError> Loader::parse(std::string_view text) {
        try {
            return from_node(YAML::Load(std::string(text)));
        } catch (const YAML::ParserException& e) {
            return fail(ConfigErrc::Malformed, line_of(e.mark), e.msg);
        } catch (const YAML::RepresentationException& e) {
            return fail(ConfigErrc::Malformed, line_of(e.mark), e.msg);
        }
    }

    hroute_detail::expected<RouterConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        try {
            return from_node(YAML::LoadFile(path));
        } catch (const YAML::BadFile&) {
            return fail(ConfigErrc::Unreadable, 0, path);
        } catch (const YAML::ParserException& e) {
            return fail(ConfigErrc::Malformed, line_of(e.mark), e.msg);
        } catch (const YAML::RepresentationException& e) {
            return fail(ConfigErrc::Malformed, line_of(e.mark), e.msg);
        }
    }

    routing::RouterOptions to_options(const RouterConfig& cfg, std::shared_ptr<obs::LogSink> sink) {
        routing::RouterOptions opts;
        opts.root_address = cfg.root_address;
        opts.router_address = cfg.router_address;
        opts.sink = std::move(sink);
        return opts;
    }

} // namespace hroute::config
