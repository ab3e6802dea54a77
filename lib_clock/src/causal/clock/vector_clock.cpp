#include "causal/clock/vector_clock.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace causal {
namespace clock {

namespace {

void check_tick(const std::string &owner, Counter value) {
    if (value == std::numeric_limits<Counter>::max()) {
        throw std::overflow_error(
            std::format("counter for {} cannot advance past {}", owner,
                        value));
    }
}

}  // namespace

VectorClock::VectorClock(std::string owner,
                         const std::vector<std::string> &roster)
    : owner_(std::move(owner)) {
    if (roster.empty()) {
        throw ConfigurationError("roster is empty");
    }
    for (const auto &id : roster) {
        if (id.empty()) {
            throw ConfigurationError("roster contains an empty process id");
        }
        auto [it, inserted] = state_.emplace(id, 0);
        if (!inserted) {
            throw ConfigurationError(
                std::format("roster contains {} more than once", id));
        }
    }
    if (!state_.contains(owner_)) {
        throw ConfigurationError(
            std::format("owner {} is not in the roster", owner_));
    }
}

auto VectorClock::restore(std::string owner, Snapshot initial) -> VectorClock {
    return VectorClock(restore_tag{}, std::move(owner), std::move(initial));
}

VectorClock::VectorClock(restore_tag, std::string owner, Snapshot initial)
    : owner_(std::move(owner)), state_(std::move(initial)) {
    if (state_.empty()) {
        throw ConfigurationError("initial snapshot is empty");
    }
    validate(state_);
    if (!state_.contains(owner_)) {
        throw ConfigurationError(
            std::format("owner {} is not in the initial snapshot", owner_));
    }
}

auto VectorClock::increment() -> Snapshot {
    std::unique_lock lock(mutex_);
    check_tick(owner_, state_[owner_]);
    state_[owner_]++;
    return state_;
}

auto VectorClock::merge(const Snapshot &received) -> Snapshot {
    std::unique_lock lock(mutex_);
    Counter owned = state_[owner_];
    if (auto it = received.find(owner_); it != received.end()) {
        owned = std::max(owned, it->second);
    }
    // checked before anything changes so a refused merge leaves no trace
    check_tick(owner_, owned);
    for (auto &[id, value] : state_) {
        auto it = received.find(id);
        if (it != received.end()) {
            value = std::max(value, it->second);
        }
    }
    state_[owner_]++;
    return state_;
}

auto VectorClock::snapshot() const -> Snapshot {
    std::shared_lock lock(mutex_);
    return state_;
}

auto VectorClock::value_of(std::string_view process_id) const -> Counter {
    std::shared_lock lock(mutex_);
    auto it = state_.find(std::string(process_id));
    return it == state_.end() ? 0 : it->second;
}

auto VectorClock::format() const -> std::string {
    return clock::format(snapshot());
}

}  // namespace clock
}  // namespace causal
