#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>

namespace json = boost::json;

/**
 * Node configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct ProtocolCfg
    {
        size_t max_envelope_data = 0xFFFF;
        bool log_skipped_entries = true;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const ProtocolCfg& protocol() const { return proto; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    ProtocolCfg proto;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
