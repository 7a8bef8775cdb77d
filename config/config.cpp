#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

std::expected<bool, std::string> get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_bool())
    {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    return it->value().as_bool();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto it = root.find("protocol"); it != root.end() && it->value().is_object())
    {
        const auto& proto = it->value().as_object();
        // Lower bound leaves room for the count and one small entry
        if (auto max_data = get_uint<size_t>(proto, "max_envelope_data", 16, 0xFFFF, 0xFFFF); max_data)
        {
            config.proto.max_envelope_data = *max_data;
        }
        else
        {
            return std::unexpected(max_data.error());
        }
        if (auto log_skipped = get_bool(proto, "log_skipped_entries", true); log_skipped)
        {
            config.proto.log_skipped_entries = *log_skipped;
        }
        else
        {
            return std::unexpected(log_skipped.error());
        }
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        config.log.level = get_string(log, "level", "info");
        config.log.file = get_string(log, "file", "");
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        if (auto console = get_bool(log, "enable_console", true); console)
        {
            config.log.enable_console = *console;
        }
        else
        {
            return std::unexpected(console.error());
        }
    }
    return config;
}
