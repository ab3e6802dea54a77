#include "causal/clock/snapshot.hpp"

#include <format>

namespace causal {
namespace clock {

std::string format(const Snapshot &snapshot) {
    std::string out = "{";
    bool first = true;
    for (const auto &[id, value] : snapshot) {
        if (!first) {
            out += ", ";
        }
        out += std::format("{}:{}", id, value);
        first = false;
    }
    out += "}";
    return out;
}

void validate(const Snapshot &snapshot) {
    for (const auto &[id, value] : snapshot) {
        if (id.empty()) {
            throw ConfigurationError("process id is empty");
        }
        if (value < 0) {
            throw ConfigurationError(
                std::format("counter for {} is negative: {}", id, value));
        }
    }
}

}  // namespace clock
}  // namespace causal
