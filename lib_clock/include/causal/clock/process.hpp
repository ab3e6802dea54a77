#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "causal/clock/causality.hpp"
#include "causal/clock/event_log.hpp"
#include "causal/clock/snapshot.hpp"
#include "causal/clock/vector_clock.hpp"

namespace causal {
namespace clock {

// Outcome of stamping a receive event.
struct Receipt {
    Snapshot remote;
    Snapshot before;
    Snapshot after;
    // Local state before the merge relative to the remote snapshot.
    Relation relation;
    EventRecord record;
};

/* The clock and event log of one process. A process owns exactly one of these
   for its lifetime and hands it by reference to whatever serves requests.
   Stamping and logging happen as one step so the log order is the clock
   order. */
class Process {
   public:
    Process(std::string id, const std::vector<std::string> &roster,
            std::optional<size_t> log_capacity = std::nullopt);

    auto local_event(std::string type, std::string description)
        -> EventRecord;
    auto receive_event(const Snapshot &remote, std::string type,
                       std::string description) -> Receipt;
    // Logs the current snapshot without ticking.
    auto record(std::string type, std::string description) -> EventRecord;

    auto id() const -> const std::string & {
        return clock_.owner();
    }

    auto clock() const -> const VectorClock & {
        return clock_;
    }

    auto log() const -> const EventLog & {
        return log_;
    }

   private:
    VectorClock clock_;
    EventLog log_;
    std::mutex stamp_mutex_;
};

}  // namespace clock
}  // namespace causal
