#pragma once

#include <boost/log/trivial.hpp>
#include <format>
#include <string>
#include <string_view>

namespace causal {
namespace logging {

enum class sink_type { null, file, console };

// Values mirror boost::log::trivial::severity_level.
enum class level { trace, debug, info, warning, error };

void init(level lvl, sink_type t, const std::string &name = "");

void write(level lvl, std::string_view message);

template <typename... Args>
void write(level lvl, std::format_string<Args...> fmt, Args &&...args) {
    write(lvl, std::string_view(std::format(fmt, std::forward<Args>(args)...)));
}

}  // namespace logging
}  // namespace causal
