#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace relay::util {

/*
  Time utilities, single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC 3339 / ISO-8601 in UTC, e.g. 2024-05-01T12:00:00.250Z
std::string ToIso8601(TimePoint tp);

double MillisBetween(TimePoint from, TimePoint to);

} // namespace relay::util
