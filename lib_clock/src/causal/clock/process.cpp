#include "causal/clock/process.hpp"

#include <utility>

namespace causal {
namespace clock {

Process::Process(std::string id, const std::vector<std::string> &roster,
                 std::optional<size_t> log_capacity)
    : clock_(id, roster), log_(id, log_capacity) {}

auto Process::local_event(std::string type, std::string description)
    -> EventRecord {
    std::unique_lock lock(stamp_mutex_);
    return log_.append(std::move(type), std::move(description),
                       clock_.increment());
}

auto Process::receive_event(const Snapshot &remote, std::string type,
                            std::string description) -> Receipt {
    std::unique_lock lock(stamp_mutex_);
    Snapshot before = clock_.snapshot();
    Snapshot after = clock_.merge(remote);
    Relation relation = relate(before, remote);
    EventRecord record =
        log_.append(std::move(type), std::move(description), after);
    return Receipt{
        .remote = remote,
        .before = std::move(before),
        .after = std::move(after),
        .relation = relation,
        .record = std::move(record),
    };
}

auto Process::record(std::string type, std::string description)
    -> EventRecord {
    std::unique_lock lock(stamp_mutex_);
    return log_.append(std::move(type), std::move(description),
                       clock_.snapshot());
}

}  // namespace clock
}  // namespace causal
