#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "causal/clock/causality.hpp"
#include "causal/clock/snapshot.hpp"

namespace causal {
namespace clock {

struct EventRecord {
    std::string id;
    std::string process_id;
    std::string type;
    Snapshot clock;
    // Wall-clock time of stamping; never used for ordering.
    std::chrono::system_clock::time_point timestamp;
    std::string description;
};

/* Append-only record of the events one process stamped, in stamping order.
   Unbounded unless a capacity is given, in which case the oldest records are
   dropped first. */
class EventLog {
   public:
    explicit EventLog(std::string process_id,
                      std::optional<size_t> capacity = std::nullopt);

    auto append(std::string type, std::string description, Snapshot snapshot)
        -> EventRecord;

    auto tail(size_t n) const -> std::vector<EventRecord>;
    auto summarize_by_type() const -> std::map<std::string, size_t>;

    auto size() const -> size_t;
    auto empty() const -> bool;

    auto process_id() const -> const std::string & {
        return process_id_;
    }

   private:
    const std::string process_id_;
    const std::optional<size_t> capacity_;
    std::deque<EventRecord> records_;
    mutable std::mutex mutex_;
};

// Relation of each record to the one before it; nullopt for the first.
auto pairwise_causality(const std::vector<EventRecord> &records)
    -> std::vector<std::optional<Relation>>;

// 8 hex characters of a random UUID.
auto make_event_id() -> std::string;

}  // namespace clock
}  // namespace causal
