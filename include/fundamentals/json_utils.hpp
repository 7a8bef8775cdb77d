#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>

namespace json_utils
{

inline boost::json::object status_msg(std::string_view status, std::string_view msg)
{
    return boost::json::object{
        {"status", status},
        {"message", msg}
    };
}

} // namespace json_utils
