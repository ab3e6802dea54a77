#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "causal/clock/snapshot.hpp"

namespace causal {
namespace clock {

/* Vector clock owned by one process. The roster, and so the key set, is fixed
   at construction; merge() never adds keys. Every operation runs under the
   instance's mutex, with increment() and merge() exclusive. */
class VectorClock {
   public:
    VectorClock(std::string owner, const std::vector<std::string> &roster);

    // Restores a clock from a snapshot taken earlier. The snapshot's keys
    // become the roster.
    static auto restore(std::string owner, Snapshot initial) -> VectorClock;

    VectorClock(const VectorClock &) = delete;
    VectorClock &operator=(const VectorClock &) = delete;

    // Local event: owner += 1.
    auto increment() -> Snapshot;

    // Receive event: component-wise max over shared keys, then owner += 1.
    // Both ticks throw std::overflow_error, with the state unchanged, when
    // the owner's counter would pass the largest Counter.
    auto merge(const Snapshot &received) -> Snapshot;

    auto snapshot() const -> Snapshot;
    auto value_of(std::string_view process_id) const -> Counter;
    auto format() const -> std::string;

    auto owner() const -> const std::string & {
        return owner_;
    }

   private:
    struct restore_tag {};
    VectorClock(restore_tag, std::string owner, Snapshot initial);

    const std::string owner_;
    Snapshot state_;
    mutable std::shared_mutex mutex_;
};

}  // namespace clock
}  // namespace causal
