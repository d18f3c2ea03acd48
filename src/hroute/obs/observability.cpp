/**
* @file observability.cpp
 * @brief Counting sinks: a silent one for tests and a printf-backed one for the app.
 */
#include "hroute/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace hroute::obs {

    const char* to_string(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off:   return "off";
        }
        return "unknown";
    }

    std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
        if (text == "debug") return LogLevel::Debug;
        if (text == "info")  return LogLevel::Info;
        if (text == "warn")  return LogLevel::Warn;
        if (text == "error") return LogLevel::Error;
        if (text == "off")   return LogLevel::Off;
        return std::nullopt;
    }

    std::string escape_for_log(std::string_view text) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(text.size());
        for (const char ch : text) {
            const auto c = static_cast<unsigned char>(ch);
            switch (ch) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7f) {
                        out += "\\u00";
                        out.push_back(kHex[c >> 4]);
                        out.push_back(kHex[c & 0x0f]);
                    } else {
                        out.push_back(ch);
                    }
            }
        }
        return out;
    }

    namespace {

    // printf a std::string by length so embedded NULs cannot truncate it.
    int print_len(const std::string& s) noexcept { return static_cast<int>(s.size()); }

    class CountingSink : public LogSink {
    public:
        void record(const DecisionEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.decisions++;
                if (e.rejected)                  ctr_.rejections++;
                else if (e.reason == "gateway")  ctr_.gateway_routes++;
                else if (e.reason == "downward") ctr_.downward_routes++;
            }
            emit(e);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    protected:
        virtual void emit(const DecisionEvent&) {}
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    class NullSink final : public CountingSink {
    public:
        void log(LogLevel, std::string_view) override {}
    };

    class StdoutSink final : public CountingSink {
    public:
        explicit StdoutSink(LogLevel min_level) noexcept : min_level_(min_level) {}

        void log(LogLevel level, std::string_view message) override {
            if (level < min_level_ || level == LogLevel::Off) return;
            const auto text = escape_for_log(message);
            std::lock_guard<std::mutex> lk(out_mu_);
            std::printf("[%s] %.*s\n", to_string(level), print_len(text), text.data());
            std::fflush(stdout);
        }

    protected:
        void emit(const DecisionEvent& e) override {
            const auto level = e.rejected ? LogLevel::Warn : LogLevel::Info;
            if (level < min_level_) return;
            const auto router      = escape_for_log(e.router);
            const auto destination = escape_for_log(e.destination);
            const auto next_hop    = escape_for_log(e.next_hop);
            const auto channel     = escape_for_log(e.channel);
            const auto reason      = escape_for_log(e.reason);
            std::lock_guard<std::mutex> lk(out_mu_);
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"router":"%.*s","destination":"%.*s","next_hop":"%.*s","channel":"%.*s","reason":"%.*s"})" "\n",
              print_len(router), router.data(), print_len(destination), destination.data(),
              print_len(next_hop), next_hop.data(), print_len(channel), channel.data(),
              print_len(reason), reason.data());
            std::fflush(stdout);
        }

    private:
        LogLevel   min_level_;
        std::mutex out_mu_;
    };

    } // namespace

    std::shared_ptr<LogSink> make_null_sink() {
        return std::make_shared<NullSink>();
    }

    std::shared_ptr<LogSink> make_stdout_sink(LogLevel min_level) {
        return std::make_shared<StdoutSink>(min_level);
    }

} // namespace hroute::obs
