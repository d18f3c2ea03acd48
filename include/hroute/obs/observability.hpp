#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: leveled log lines, decision events and counters.
 * @details The router only depends on the LogSink interface. A printf-backed sink is
 *          provided for the app, a silent one for tests.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hroute::obs {

    /** @enum LogLevel
     *  @brief Severity of a log line. Off disables all output.
     */
    enum class LogLevel : std::uint8_t { Debug = 0, Info, Warn, Error, Off };

    /// Lower-case label ("debug", "info", ...).
    const char* to_string(LogLevel level) noexcept;

    /// Parse a lower-case label; std::nullopt if unknown.
    std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

    /**
     * @brief Escape text for a single log line.
     * @details '"' and '\\' get a backslash, \n \r \t use their short escapes, other
     *          control bytes (including NUL and DEL) become a "u00XX" escape. The result never
     *          spans more than one line and is safe inside a JSON string.
     */
    std::string escape_for_log(std::string_view text);

    /** @struct Counters
     *  @brief Process-level counters for routing decisions.
     */
    struct Counters {
        uint64_t decisions{0};        ///< Total decisions recorded (including rejections)
        uint64_t gateway_routes{0};   ///< Decisions that escalated to the gateway
        uint64_t downward_routes{0};  ///< Decisions that descended one level
        uint64_t rejections{0};       ///< Decisions that ended in a RouteError
    };

    /** @struct DecisionEvent
     *  @brief Payload describing a single dispatch decision.
     */
    struct DecisionEvent {
        std::string router;       ///< Address of the deciding router
        std::string destination;  ///< Destination address as received
        std::string next_hop;     ///< Next-hop address (empty on rejection)
        std::string channel;      ///< Next-hop channel name (empty on rejection)
        std::string reason;       ///< "gateway", "downward" or the error label
        bool        rejected{false}; ///< True if the decision ended in an error
    };

    /** @class LogSink
     *  @brief Injected logging capability. Implementations must be thread-safe.
     */
    class LogSink {
    public:
        virtual ~LogSink() = default;
        /// Record a single leveled message.
        virtual void log(LogLevel level, std::string_view message) = 0;
        /// Record a single decision event.
        virtual void record(const DecisionEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Sink that only keeps counters. Safe default when none is injected.
    std::shared_ptr<LogSink> make_null_sink();

    /// printf-backed sink writing to stdout, dropping lines below @p min_level.
    std::shared_ptr<LogSink> make_stdout_sink(LogLevel min_level = LogLevel::Info);

} // namespace hroute::obs
