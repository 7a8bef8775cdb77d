#pragma once
#include "upd/envelope.hpp"
#include "upd/cache_request.hpp"
#include "upd/cache_response.hpp"
#include "upd/diagnostics.hpp"
#include "peer/message.hpp"
#include "logger/metrics.hpp"
#include "config.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>
#include <span>

namespace upd
{

/**
 * Receives UPD envelopes and hands the decoded payload to the registered
 * handler. Diagnostics from list decoding are written to the log here, not
 * in the codecs.
 *
 * Handlers are registered before the first route() call; after that the
 * dispatcher may be shared between threads.
 */
class Dispatcher
{
public:
    enum class errc
    {
        OK = 0,
        envelope_err = 1,
        unknown_operation = 2,
        no_handler = 3,
        size_err = 4
    };

    // Returns the messages the requester is missing, looked up in the local cache
    using RequestHandler = std::function<std::vector<peer::Message>(const CacheRequest&)>;
    using ResponseHandler = std::function<void(const CacheResponse&)>;

    // Envelope to send back, if the operation calls for one
    using reply_t = std::optional<bytes::buffer_t>;

    explicit Dispatcher(Config::ProtocolCfg cfg = {});

    void on_request(RequestHandler hdl);
    void on_response(ResponseHandler hdl);

    std::expected<reply_t, errc> route(std::span<const std::byte> data);
    std::expected<bytes::buffer_t, errc> make_request(std::span<const CacheSourceRef> entries) const;

    [[nodiscard]] const SyncMetrics& metrics() const { return stats; }

private:
    Config::ProtocolCfg cfg;
    RequestHandler req_hdl;
    ResponseHandler resp_hdl;
    SyncMetrics stats;

    std::expected<reply_t, errc> handle_request(std::span<const std::byte> payload);
    std::expected<reply_t, errc> handle_response(std::span<const std::byte> payload);
    void report(std::string_view what, uint32_t declared, size_t recovered, std::span<const Diagnostic> diags);
};

std::string_view describe(Dispatcher::errc ec);

} // namespace upd
