#include "causal/service/wire.hpp"

#include <boost/algorithm/string.hpp>
#include <format>
#include <stdexcept>
#include <tuple>

namespace causal {
namespace service {

clock::Snapshot to_snapshot(const WireClock &wire) {
    clock::Snapshot snapshot;
    for (const auto &[id, value] : wire) {
        snapshot.emplace(id, value);
    }
    return snapshot;
}

void write_snapshot(const clock::Snapshot &snapshot, WireClock *wire) {
    wire->clear();
    for (const auto &[id, value] : snapshot) {
        (*wire)[id] = value;
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format(
        "{:%Y-%m-%d %H:%M:%S}",
        std::chrono::floor<std::chrono::milliseconds>(tp));
}

std::vector<std::string> parse_roster(const std::string &text) {
    std::vector<std::string> roster;
    boost::split(roster, text, boost::is_any_of(","));
    for (auto &id : roster) {
        boost::trim(id);
    }
    return roster;
}

Address::Address(const std::string &host, int port) : host(host), port(port) {}

Address Address::parse(const std::string &text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 ||
        colon + 1 == text.size()) {
        throw std::invalid_argument(
            std::format("expected host:port, got '{}'", text));
    }
    int port = 0;
    try {
        size_t used = 0;
        port = std::stoi(text.substr(colon + 1), &used);
        if (used != text.size() - colon - 1) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception &) {
        throw std::invalid_argument(
            std::format("bad port in '{}'", text));
    }
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument(
            std::format("port out of range in '{}'", text));
    }
    return Address(text.substr(0, colon), port);
}

Address::operator std::string() const {
    return std::format("{}:{}", host, port);
}

bool Address::operator<(const Address &rhs) const {
    return std::tie(host, port) < std::tie(rhs.host, rhs.port);
}

bool Address::operator==(const Address &rhs) const {
    return std::tie(host, port) == std::tie(rhs.host, rhs.port);
}

}  // namespace service
}  // namespace causal
