#include "causal/clock/causality.hpp"

namespace causal {
namespace clock {

auto happened_before(const Snapshot &a, const Snapshot &b) -> bool {
    bool any_less = false;
    for (const auto &[id, value] : a) {
        auto it = b.find(id);
        if (it == b.end()) {
            continue;
        }
        if (value > it->second) {
            return false;
        }
        if (value < it->second) {
            any_less = true;
        }
    }
    return any_less;
}

auto happened_after(const Snapshot &a, const Snapshot &b) -> bool {
    return happened_before(b, a);
}

auto is_concurrent(const Snapshot &a, const Snapshot &b) -> bool {
    return !happened_before(a, b) && !happened_before(b, a);
}

auto relate(const Snapshot &a, const Snapshot &b) -> Relation {
    if (happened_before(a, b)) {
        return Relation::before;
    }
    if (happened_before(b, a)) {
        return Relation::after;
    }
    return Relation::concurrent;
}

auto compare(const Snapshot &a, const Snapshot &b) -> int {
    switch (relate(a, b)) {
        case Relation::before:
            return -1;
        case Relation::after:
            return 1;
        case Relation::concurrent:
            break;
    }
    return 0;
}

auto to_string(Relation r) -> std::string_view {
    switch (r) {
        case Relation::before:
            return "happened-before";
        case Relation::after:
            return "happened-after";
        case Relation::concurrent:
            break;
    }
    return "concurrent";
}

auto symbol(Relation r) -> std::string_view {
    switch (r) {
        case Relation::before:
            return "->";
        case Relation::after:
            return "<-";
        case Relation::concurrent:
            break;
    }
    return "||";
}

}  // namespace clock
}  // namespace causal
