#include "upd/dispatcher.hpp"
#include "logger.hpp"

#include <utility>

namespace upd
{

Dispatcher::Dispatcher(Config::ProtocolCfg cfg) : cfg(cfg)
{

}

void Dispatcher::on_request(RequestHandler hdl)
{
    req_hdl = std::move(hdl);
}

void Dispatcher::on_response(ResponseHandler hdl)
{
    resp_hdl = std::move(hdl);
}

std::expected<Dispatcher::reply_t, Dispatcher::errc> Dispatcher::route(std::span<const std::byte> data)
{
    stats.envelopes_received++;

    auto env = decode_envelope(data);
    if (!env)
    {
        stats.envelopes_rejected++;
        LOG_WARN("Upd: dropping envelope ({} bytes): {}", data.size(), describe(env.error()));
        return std::unexpected(errc::envelope_err);
    }

    switch (env->operation)
    {
        case Operation::CacheRequest:
            return handle_request(env->data);
        case Operation::CacheResponse:
            return handle_response(env->data);
    }

    stats.envelopes_rejected++;
    LOG_WARN("Upd: unknown operation {}", std::to_underlying(env->operation));
    return std::unexpected(errc::unknown_operation);
}

std::expected<bytes::buffer_t, Dispatcher::errc> Dispatcher::make_request(std::span<const CacheSourceRef> entries) const
{
    auto payload = encode_cache_request(entries);
    if (payload.size() > cfg.max_envelope_data)
    {
        LOG_WARN("Upd: cache request of {} entries needs {} bytes, limit is {}",
                 entries.size(), payload.size(), cfg.max_envelope_data);
        return std::unexpected(errc::size_err);
    }

    auto env = encode_envelope(Operation::CacheRequest, payload);
    if (!env)
    {
        return std::unexpected(errc::size_err);
    }
    return std::move(*env);
}

std::expected<Dispatcher::reply_t, Dispatcher::errc> Dispatcher::handle_request(std::span<const std::byte> payload)
{
    if (!req_hdl)
    {
        stats.envelopes_rejected++;
        LOG_WARN("Upd: no handler for cache requests");
        return std::unexpected(errc::no_handler);
    }

    stats.requests_received++;
    auto req = decode_cache_request(payload);
    report("cache request", req.value.declared_count, req.value.recovered_count(), req.diagnostics);

    auto missing = req_hdl(req.value);

    auto packed = pack_cache_response(missing, cfg.max_envelope_data);
    stats.messages_sent += packed.packed;
    if (packed.packed < missing.size())
    {
        stats.messages_truncated += missing.size() - packed.packed;
        LOG_INFO("Upd: cache response holds {} of {} messages, rest left for a later request",
                 packed.packed, missing.size());
    }

    auto env = encode_envelope(Operation::CacheResponse, packed.data);
    if (!env)
    {
        return std::unexpected(errc::size_err);
    }
    return reply_t{std::move(*env)};
}

std::expected<Dispatcher::reply_t, Dispatcher::errc> Dispatcher::handle_response(std::span<const std::byte> payload)
{
    if (!resp_hdl)
    {
        stats.envelopes_rejected++;
        LOG_WARN("Upd: no handler for cache responses");
        return std::unexpected(errc::no_handler);
    }

    stats.responses_received++;
    auto resp = decode_cache_response(payload);
    report("cache response", resp.value.declared_count, resp.value.recovered_count(), resp.diagnostics);

    resp_hdl(resp.value);
    return reply_t{};
}

void Dispatcher::report(std::string_view what, uint32_t declared, size_t recovered, std::span<const Diagnostic> diags)
{
    stats.entries_recovered += recovered;
    for (const auto& d : diags)
    {
        if (d.reason == SkipReason::corrupt_message || d.reason == SkipReason::corrupt_contact)
        {
            stats.entries_skipped++;
        }
    }

    if (diags.empty())
    {
        LOG_DEBUG("Upd: {} with {} entries", what, recovered);
        return;
    }

    if (!cfg.log_skipped_entries)
    {
        return;
    }

    LOG_WARN("Upd: {} recovered {} of {} declared entries", what, recovered, declared);
    for (const auto& d : diags)
    {
        LOG_WARN("Upd: {}: {}", what, d);
    }
}

std::string_view describe(Dispatcher::errc ec)
{
    switch (ec)
    {
        case Dispatcher::errc::OK:                return "ok";
        case Dispatcher::errc::envelope_err:      return "malformed envelope";
        case Dispatcher::errc::unknown_operation: return "unknown operation";
        case Dispatcher::errc::no_handler:        return "no handler registered";
        case Dispatcher::errc::size_err:          return "payload exceeds envelope limit";
    }
    return "unknown";
}

} // namespace upd
