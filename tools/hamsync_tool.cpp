#include "upd/dispatcher.hpp"
#include "upd/envelope.hpp"
#include "upd/cache_request.hpp"
#include "upd/cache_response.hpp"
#include "upd/json_render.hpp"
#include "peer/contact.hpp"
#include "peer/message.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/json_utils.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <boost/json.hpp>
#include <charconv>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace {

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  request <seq>:<CALL@ip> ...                   Encode a cache request envelope");
    std::println("  response <CALL@ip>:<seq>:<type>:<text> ...    Encode a cache response envelope");
    std::println("                                                (type: text, beacon, position)");
    std::println("  decode <hex>                                  Decode an envelope and its payload");
}

std::optional<uint64_t> parse_u64(std::string_view sv)
{
    uint64_t val = 0;
    if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val); ec == std::errc{} && ptr == sv.data() + sv.size())
    {
        return val;
    }
    return std::nullopt;
}

std::optional<peer::MessageType> parse_type(std::string_view sv)
{
    if (sv == "text") return peer::MessageType::Text;
    if (sv == "beacon") return peer::MessageType::Beacon;
    if (sv == "position") return peer::MessageType::Position;
    return std::nullopt;
}

int fail(std::string_view msg)
{
    std::println(stderr, "{}", boost::json::serialize(json_utils::status_msg("error", msg)));
    return 1;
}

int cmd_request(const upd::Dispatcher& disp, std::span<char*> args)
{
    std::vector<upd::CacheSourceRef> entries;
    for (std::string_view arg : args)
    {
        auto colon = arg.find(':');
        if (colon == std::string_view::npos)
        {
            return fail(std::format("Expected <seq>:<CALL@ip>, got '{}'", arg));
        }

        auto seq = parse_u64(arg.substr(0, colon));
        auto ct = peer::Contact::from_string(arg.substr(colon + 1));
        if (!seq || !ct)
        {
            return fail(std::format("Invalid cache entry '{}'", arg));
        }
        entries.push_back({.seq_counter = *seq, .source = std::move(*ct)});
    }

    auto env = disp.make_request(entries);
    if (!env)
    {
        return fail(upd::describe(env.error()));
    }

    std::println("{}", bytes::to_hex(*env));
    return 0;
}

int cmd_response(const Config& cfg, std::span<char*> args)
{
    std::vector<peer::Message> messages;
    for (std::string_view arg : args)
    {
        // CALL@ip:seq:type:text, the text may itself contain ':'
        auto first = arg.find(':');
        auto second = first == std::string_view::npos ? first : arg.find(':', first + 1);
        auto third = second == std::string_view::npos ? second : arg.find(':', second + 1);
        if (third == std::string_view::npos)
        {
            return fail(std::format("Expected <CALL@ip>:<seq>:<type>:<text>, got '{}'", arg));
        }

        auto ct = peer::Contact::from_string(arg.substr(0, first));
        auto seq = parse_u64(arg.substr(first + 1, second - first - 1));
        auto type = parse_type(arg.substr(second + 1, third - second - 1));
        if (!ct || !seq || !type)
        {
            return fail(std::format("Invalid message '{}'", arg));
        }

        auto msg = peer::Message::make(*type, *seq, std::move(*ct), bytes::to_bytes(arg.substr(third + 1)));
        if (!msg)
        {
            return fail(std::format("Message payload too large in '{}'", arg));
        }
        messages.push_back(std::move(*msg));
    }

    auto packed = upd::pack_cache_response(messages, cfg.protocol().max_envelope_data);
    if (packed.packed < messages.size())
    {
        auto notice = std::format("Only {} of {} messages fit into one envelope", packed.packed, messages.size());
        LOG_WARN("{}", notice);
        std::println(stderr, "{}", boost::json::serialize(json_utils::status_msg("warning", notice)));
    }

    auto env = upd::encode_envelope(upd::Operation::CacheResponse, packed.data);
    if (!env)
    {
        return fail(upd::describe(env.error()));
    }

    std::println("{}", bytes::to_hex(*env));
    return 0;
}

int cmd_decode(std::string_view hex)
{
    auto raw = bytes::from_hex(hex);
    if (!raw)
    {
        return fail(raw.error());
    }

    auto env = upd::decode_envelope(*raw);
    if (!env)
    {
        return fail(upd::describe(env.error()));
    }

    boost::json::object out;
    switch (env->operation)
    {
        case upd::Operation::CacheRequest:
            out = upd::to_json(upd::decode_cache_request(env->data));
            break;
        case upd::Operation::CacheResponse:
            out = upd::to_json(upd::decode_cache_response(env->data));
            break;
        default:
            return fail(std::format("Unknown operation {}", std::to_underlying(env->operation)));
    }

    std::println("{}", boost::json::serialize(out));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<char*> args(argv + 1, argv + argc);

    std::optional<std::string> config_path;
    if (args.size() >= 2 && std::string_view(args[0]) == "--config")
    {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    Config config = Config::load_defaults();
    if (config_path)
    {
        auto loaded = Config::load(*config_path);
        if (!loaded)
        {
            std::println(stderr, "Failed to load config: {}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    // stdout carries the tool's output, so logs only go to a file when configured
    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, false); !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    upd::Dispatcher disp(config.protocol());

    std::string_view cmd = args[0];
    std::span<char*> rest = std::span{args}.subspan(1);

    int rc = 1;
    if (cmd == "request" && !rest.empty())
    {
        rc = cmd_request(disp, rest);
    }
    else if (cmd == "response" && !rest.empty())
    {
        rc = cmd_response(config, rest);
    }
    else if (cmd == "decode" && rest.size() == 1)
    {
        rc = cmd_decode(rest[0]);
    }
    else
    {
        print_usage(argv[0]);
    }

    Logger::shutdown();
    return rc;
}
