#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace mirrorwatch::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// Unset or negative durations map to `fallback`.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback = std::chrono::milliseconds{0});
google::protobuf::Duration ToProtoDuration(std::chrono::milliseconds d);

constexpr uint64_t kMillisPerHour = 60ull * 60ull * 1000ull;
constexpr uint64_t kMillisPerDay  = 24ull * kMillisPerHour;

} // namespace mirrorwatch::util
