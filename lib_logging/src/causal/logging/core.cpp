#include "causal/logging/core.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <iostream>
#include <utility>

const auto format = "[%TimeStamp%] [%Severity%] %Message%";

namespace causal {
namespace logging {

void init(level lvl, sink_type t, const std::string &name) {
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();
    // level shares its numbering with trivial::severity_level (trace = 0
    // through error = 4, fatal unused), so the threshold compares directly.
    boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                        std::to_underlying(lvl));
    switch (t) {
        case sink_type::null:
            // without a sink Boost.Log falls back to stderr, so disable it
            boost::log::core::get()->set_logging_enabled(false);
            return;
        case sink_type::file: {
            boost::log::add_file_log(boost::log::keywords::file_name = name,
                                     boost::log::keywords::open_mode =
                                         std::ios_base::app,
                                     boost::log::keywords::auto_flush = true,
                                     boost::log::keywords::format = format);
            break;
        }
        case sink_type::console: {
            boost::log::add_console_log(std::clog,
                                        boost::log::keywords::auto_flush = true,
                                        boost::log::keywords::format = format);
            break;
        }
    }
    boost::log::core::get()->set_logging_enabled(true);
}

void write(level lvl, std::string_view message) {
    switch (lvl) {
        case level::trace:
            BOOST_LOG_TRIVIAL(trace) << message;
            break;
        case level::debug:
            BOOST_LOG_TRIVIAL(debug) << message;
            break;
        case level::info:
            BOOST_LOG_TRIVIAL(info) << message;
            break;
        case level::warning:
            BOOST_LOG_TRIVIAL(warning) << message;
            break;
        case level::error:
            BOOST_LOG_TRIVIAL(error) << message;
            break;
    }
}

}  // namespace logging
}  // namespace causal
