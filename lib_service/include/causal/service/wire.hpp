#pragma once

#include <google/protobuf/map.h>

#include <causal/clock/snapshot.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace causal {
namespace service {

using WireClock = google::protobuf::Map<std::string, int64_t>;

// Largest range end whose closed-form sum fits in int64_t.
constexpr int64_t MAX_RANGE_END = 3037000498;

clock::Snapshot to_snapshot(const WireClock &wire);

void write_snapshot(const clock::Snapshot &snapshot, WireClock *wire);

// yyyy-mm-dd HH:MM:SS.mmm, UTC.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Comma-separated process ids, whitespace trimmed.
std::vector<std::string> parse_roster(const std::string &text);

class Address {
   public:
    Address(const std::string &host, int port);
    std::string host;
    int port;

    // host:port; throws std::invalid_argument when malformed.
    static Address parse(const std::string &text);

    operator std::string() const;
    bool operator<(const Address &rhs) const;
    bool operator==(const Address &rhs) const;
};

}  // namespace service
}  // namespace causal
