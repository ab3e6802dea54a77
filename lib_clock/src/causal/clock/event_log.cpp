#include "causal/clock/event_log.hpp"

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace causal {
namespace clock {

EventLog::EventLog(std::string process_id, std::optional<size_t> capacity)
    : process_id_(std::move(process_id)), capacity_(capacity) {
    if (capacity_ && *capacity_ == 0) {
        throw ConfigurationError("event log capacity must be positive");
    }
}

auto EventLog::append(std::string type, std::string description,
                      Snapshot snapshot) -> EventRecord {
    EventRecord record{
        .id = make_event_id(),
        .process_id = process_id_,
        .type = std::move(type),
        .clock = std::move(snapshot),
        .timestamp = std::chrono::system_clock::now(),
        .description = std::move(description),
    };
    std::unique_lock lock(mutex_);
    if (capacity_ && records_.size() == *capacity_) {
        records_.pop_front();
    }
    records_.push_back(record);
    return record;
}

auto EventLog::tail(size_t n) const -> std::vector<EventRecord> {
    std::unique_lock lock(mutex_);
    size_t count = std::min(n, records_.size());
    return {records_.end() - static_cast<std::ptrdiff_t>(count),
            records_.end()};
}

auto EventLog::summarize_by_type() const -> std::map<std::string, size_t> {
    std::unique_lock lock(mutex_);
    std::map<std::string, size_t> counts;
    for (const auto &record : records_) {
        counts[record.type]++;
    }
    return counts;
}

auto EventLog::size() const -> size_t {
    std::unique_lock lock(mutex_);
    return records_.size();
}

auto EventLog::empty() const -> bool {
    std::unique_lock lock(mutex_);
    return records_.empty();
}

auto pairwise_causality(const std::vector<EventRecord> &records)
    -> std::vector<std::optional<Relation>> {
    std::vector<std::optional<Relation>> relations;
    relations.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (i == 0) {
            relations.emplace_back(std::nullopt);
        } else {
            relations.emplace_back(
                relate(records[i - 1].clock, records[i].clock));
        }
    }
    return relations;
}

auto make_event_id() -> std::string {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator()).substr(0, 8);
}

}  // namespace clock
}  // namespace causal
