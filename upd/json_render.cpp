#include "upd/json_render.hpp"
#include "fundamentals/bytes.hpp"

#include <utility>

namespace json = boost::json;

namespace upd
{

namespace {

std::string_view type_name(peer::MessageType type)
{
    switch (type)
    {
        case peer::MessageType::Text:     return "text";
        case peer::MessageType::Beacon:   return "beacon";
        case peer::MessageType::Position: return "position";
    }
    return "unknown";
}

json::array to_json_array(std::span<const Diagnostic> diags)
{
    json::array ret;
    for (const auto& d : diags)
    {
        ret.push_back(to_json(d));
    }
    return ret;
}

} // namespace

json::object to_json(const peer::Contact& ct)
{
    return json::object{
        {"callsign", ct.callsign()},
        {"address", ct.address().to_string()}
    };
}

json::object to_json(const peer::Message& msg)
{
    json::object ret{
        {"type", type_name(msg.type())},
        {"seq", msg.seq_counter()},
        {"source", to_json(msg.source())},
        {"payload_hex", bytes::to_hex(msg.payload())}
    };
    // payload_hex alone stands in for text that is not valid UTF-8
    if (msg.type() == peer::MessageType::Text && bytes::valid_utf8(msg.payload()))
    {
        ret["text"] = json::string(bytes::to_string(msg.payload()));
    }
    return ret;
}

json::object to_json(const Diagnostic& d)
{
    return json::object{
        {"reason", describe(d.reason)},
        {"index", d.index},
        {"offset", d.offset}
    };
}

json::object to_json(const Decoded<CacheRequest>& req)
{
    json::array entries;
    for (const auto& e : req.value.entries)
    {
        entries.push_back(json::object{
            {"seq", e.seq_counter},
            {"source", to_json(e.source)}
        });
    }

    return json::object{
        {"operation", "cache_request"},
        {"declared", req.value.declared_count},
        {"recovered", req.value.recovered_count()},
        {"entries", std::move(entries)},
        {"diagnostics", to_json_array(req.diagnostics)}
    };
}

json::object to_json(const Decoded<CacheResponse>& resp)
{
    json::array entries;
    for (const auto& e : resp.value.entries)
    {
        auto obj = to_json(e.message);
        obj["length"] = e.length;
        entries.push_back(std::move(obj));
    }

    return json::object{
        {"operation", "cache_response"},
        {"declared", resp.value.declared_count},
        {"recovered", resp.value.recovered_count()},
        {"entries", std::move(entries)},
        {"diagnostics", to_json_array(resp.diagnostics)}
    };
}

} // namespace upd
