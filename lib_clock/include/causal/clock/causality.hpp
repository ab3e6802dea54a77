#pragma once

#include <string_view>

#include "causal/clock/snapshot.hpp"

namespace causal {
namespace clock {

/* Relations between two snapshots. Only keys present in both snapshots take
   part in a comparison; a key missing on one side is skipped, not read as 0.
   With no shared key nothing happened before anything. */

enum class Relation { before, after, concurrent };

auto happened_before(const Snapshot &a, const Snapshot &b) -> bool;
auto happened_after(const Snapshot &a, const Snapshot &b) -> bool;
auto is_concurrent(const Snapshot &a, const Snapshot &b) -> bool;

auto relate(const Snapshot &a, const Snapshot &b) -> Relation;

// -1 if a happened before b, 1 if after, 0 if concurrent. 0 is not equality.
auto compare(const Snapshot &a, const Snapshot &b) -> int;

auto to_string(Relation r) -> std::string_view;
auto symbol(Relation r) -> std::string_view;

}  // namespace clock
}  // namespace causal
