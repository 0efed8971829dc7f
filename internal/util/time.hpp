#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace gencore::util {

/*
  Time utilities — single place to control clock source later.

  Persisted timestamps are unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMillis();

uint64_t ToUnixMillis(TimePoint tp);

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

} // namespace gencore::util
