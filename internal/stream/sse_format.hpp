#pragma once

#include <string>

#include "internal/model/event.hpp"

namespace relay::stream {

/*
  Server-sent-events framing:

    event: <type>
    id: <event id>
    data: <json object>
    timestamp: <ISO-8601>
    <blank line>
*/
std::string FormatSse(const model::Event& event);

} // namespace relay::stream
