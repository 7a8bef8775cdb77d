#pragma once
#include "upd/envelope.hpp"
#include "upd/cache_request.hpp"
#include "upd/cache_response.hpp"
#include "upd/diagnostics.hpp"
#include "peer/contact.hpp"
#include "peer/message.hpp"

#include <boost/json.hpp>
#include <span>

// JSON views of decoded protocol values, for tooling and inspection
namespace upd
{

boost::json::object to_json(const peer::Contact& ct);
boost::json::object to_json(const peer::Message& msg);
boost::json::object to_json(const Diagnostic& d);
boost::json::object to_json(const Decoded<CacheRequest>& req);
boost::json::object to_json(const Decoded<CacheResponse>& resp);

} // namespace upd
