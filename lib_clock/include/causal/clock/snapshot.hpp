#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace causal {
namespace clock {

using Counter = int64_t;

// Process id -> counter. Ordered by id, which is the order format() renders.
using Snapshot = std::map<std::string, Counter>;

// Thrown when a clock is constructed from a malformed roster or snapshot.
class ConfigurationError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

// Renders as {A:1, B:0}.
std::string format(const Snapshot &snapshot);

// Throws ConfigurationError on an empty id or a negative counter.
void validate(const Snapshot &snapshot);

}  // namespace clock
}  // namespace causal
