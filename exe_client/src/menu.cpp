#include "menu.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <causal/clock/event_log.hpp>
#include <causal/logging/core.hpp>
#include <causal/service/wire.hpp>
#include <charconv>
#include <format>
#include <numeric>
#include <print>
#include <stdexcept>

namespace lg = causal::logging;

namespace causal {
namespace client {

namespace {

constexpr std::string_view RULE =
    "------------------------------------------------------------";

void banner(std::ostream &out, std::string_view title) {
    std::println(out, "\n{}\n {}\n{}", RULE, title, RULE);
}

}  // namespace

std::string describe_relation(clock::Relation relation) {
    return std::format("{} ({})", clock::symbol(relation),
                       clock::to_string(relation));
}

std::vector<size_t> parse_selection(const std::string &text, size_t count) {
    std::vector<std::string> parts;
    boost::split(parts, text, boost::is_any_of(","));
    std::vector<size_t> selected;
    for (auto &part : parts) {
        boost::trim(part);
        size_t number = 0;
        auto [end, ec] =
            std::from_chars(part.data(), part.data() + part.size(), number);
        if (part.empty() || ec != std::errc() ||
            end != part.data() + part.size() || number < 1 ||
            number > count) {
            throw std::invalid_argument(
                std::format("'{}' is not a server between 1 and {}", part,
                            count));
        }
        if (std::find(selected.begin(), selected.end(), number - 1) ==
            selected.end()) {
            selected.push_back(number - 1);
        }
    }
    return selected;
}

Menu::Menu(Client &client, std::istream &in, std::ostream &out)
    : client_(client), in_(in), out_(out) {}

void Menu::run() {
    std::println(out_, "Client id: {}", client_.session_id());
    std::println(out_, "Initial vector clock: {}",
                 client_.process().clock().format());

    while (true) {
        banner(out_, "OPTIONS");
        std::println(out_, " 1. Calculate with auto load balancing");
        std::println(out_, " 2. Calculate with manual server selection");
        std::println(out_, " 3. Check server health");
        std::println(out_, " 4. Show vector clock state and analysis");
        std::println(out_, " 5. Show event log with causality");
        std::println(out_, " 0. Exit");

        auto choice = prompt("\nSelect option: ");
        if (!choice || *choice == "0") {
            client_.process().record("CLIENT_STOP",
                                     "Client application stopped");
            std::println(out_, "\nExiting...");
            return;
        }

        try {
            if (*choice == "1") {
                calculate_auto();
            } else if (*choice == "2") {
                calculate_manual();
            } else if (*choice == "3") {
                show_health();
            } else if (*choice == "4") {
                show_clock();
            } else if (*choice == "5") {
                show_events();
            } else {
                std::println(out_, "Invalid selection.");
            }
        } catch (const std::exception &e) {
            lg::write(lg::level::error, "option {} failed: {}", *choice,
                      e.what());
            std::println(out_, "\nError: {}", e.what());
        }
    }
}

std::optional<std::string> Menu::prompt(std::string_view text) {
    out_ << text << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    boost::trim(line);
    return line;
}

std::optional<int64_t> Menu::prompt_number(std::string_view text) {
    auto line = prompt(text);
    if (!line) {
        return std::nullopt;
    }
    int64_t n = 0;
    auto [end, ec] = std::from_chars(line->data(),
                                     line->data() + line->size(), n);
    if (ec != std::errc() || end != line->data() + line->size() || n < 1 ||
        n > service::MAX_RANGE_END) {
        std::println(out_, "Invalid number. Enter an integer between 1 and {}.",
                     service::MAX_RANGE_END);
        return std::nullopt;
    }
    return n;
}

void Menu::calculate_auto() {
    auto n = prompt_number("\nEnter a number (n) to sum 1..n: ");
    if (!n) {
        return;
    }

    banner(out_, "AUTO MODE - CHECKING ALL SERVERS");
    auto available = client_.available_servers();
    if (available.empty()) {
        std::println(out_,
                     "\nNo servers available! Start at least one server.");
        return;
    }
    show_calculation(client_.calculate(*n, available, "Auto mode"));
}

void Menu::calculate_manual() {
    banner(out_, "MANUAL SERVER SELECTION MODE");

    const auto &servers = client_.servers();
    std::vector<bool> online;
    std::println(out_, "\nServer status:");
    for (size_t i = 0; i < servers.size(); ++i) {
        online.push_back(client_.is_available(servers[i]));
        std::println(out_, "  {}. {:<12} ({}) - {}", i + 1, servers[i].name,
                     std::string(servers[i].address),
                     online.back() ? "ONLINE" : "OFFLINE");
    }

    auto selection =
        prompt("\nSelect servers to use (comma-separated, e.g. 1,3): ");
    if (!selection) {
        return;
    }
    std::vector<size_t> indices;
    try {
        indices = parse_selection(*selection, servers.size());
    } catch (const std::invalid_argument &e) {
        std::println(out_, "Invalid selection: {}", e.what());
        return;
    }

    std::vector<ServerInfo> chosen;
    std::vector<std::string> numbers;
    for (size_t index : indices) {
        numbers.push_back(std::to_string(index + 1));
        if (online[index]) {
            chosen.push_back(servers[index]);
        } else {
            std::println(out_, "Warning: {} is offline", servers[index].name);
        }
    }
    if (chosen.empty()) {
        std::println(out_, "\nNone of the selected servers are available!");
        return;
    }

    auto n = prompt_number("\nEnter a number (n): ");
    if (!n) {
        return;
    }
    show_calculation(client_.calculate(
        *n, chosen, std::format("Manual: {}", boost::join(numbers, ","))));
}

void Menu::show_calculation(const Calculation &calculation) {
    std::println(out_, "\nRequest {} over {} server(s), load distribution:",
                 calculation.request_id, calculation.server_count);
    for (const auto &result : calculation.results) {
        std::println(out_, "  {:<12}: [{:>6}-{:>6}] = {:>6} nums ({:.1f}%)",
                     result.server.name, result.range.start, result.range.end,
                     result.range.size(),
                     result.range.size() * 100.0 / calculation.n);
    }

    for (const auto &failure : calculation.failures) {
        std::println(out_, "  {:<12}: [{:>6}-{:>6}] FAILED: {}",
                     failure.server.name, failure.range.start,
                     failure.range.end, failure.error);
    }

    if (calculation.results.empty()) {
        std::println(out_, "\nAll servers failed!");
        return;
    }

    banner(out_, "RESULTS WITH VECTOR CLOCK ANALYSIS");
    for (const auto &result : calculation.results) {
        std::println(out_, "\n{}:", result.server.name);
        std::println(out_, "  Range: [{}-{}] | Sum: {} | At: {}",
                     result.range.start, result.range.end, result.partial_sum,
                     result.timestamp);
        std::println(out_, "  Sent VC:     {}", clock::format(result.sent));
        std::println(out_, "  Received VC: {}", clock::format(result.received));
        std::println(out_, "  Causality:   {}",
                     describe_relation(result.relation));
    }

    banner(out_, "FINAL RESULT");
    std::println(out_, " Total sum (1 to {}): {}", calculation.n,
                 calculation.total);
    std::println(out_, " Total time: {} ms", calculation.elapsed.count());
    std::println(out_, " Servers: {}/{}", calculation.results.size(),
                 calculation.server_count);
    std::println(out_, " Request: {}", calculation.request_id);
    std::println(out_, " Final VC: {}", clock::format(calculation.final_clock));
    if (calculation.verified()) {
        std::println(out_, "Verification: CORRECT!");
    } else {
        std::println(out_, "Verification: expected {}, got {}",
                     calculation.expected(), calculation.total);
    }
}

void Menu::show_health() {
    auto reports = client_.check_health();
    banner(out_, "SERVER HEALTH CHECK");
    std::println(out_, " Current VC: {}\n", client_.process().clock().format());
    for (const auto &report : reports) {
        if (!report.reachable) {
            std::println(out_, "  {:<12} | DOWN", report.server.name);
        } else if (report.healthy) {
            std::println(out_, "  {:<12} | HEALTHY | Uptime: {}s | VC: {}",
                         report.server.name, report.uptime_seconds,
                         clock::format(report.server_clock));
        } else {
            std::println(out_, "  {:<12} | UNHEALTHY", report.server.name);
        }
    }
}

void Menu::show_clock() {
    banner(out_, "VECTOR CLOCK STATE & ANALYSIS");

    const auto &process = client_.process();
    clock::Snapshot current = process.clock().snapshot();

    std::println(out_, "\nCurrent vector clock:\n  {}", clock::format(current));
    std::println(out_, "\nBreakdown:");
    for (const auto &[id, counter] : current) {
        std::println(out_, "  {:<15}: {:>3} events", id, counter);
    }

    clock::Counter total = std::accumulate(
        current.begin(), current.end(), clock::Counter{0},
        [](clock::Counter sum, const auto &entry) {
            return sum + entry.second;
        });
    std::println(out_, "\nEvents logged:        {}", process.log().size());
    std::println(out_, "Processes tracked:    {}", current.size());
    std::println(out_, "Total logical events: {}", total);

    auto recent = process.log().tail(3);
    if (recent.size() >= 2) {
        std::println(out_, "\nRecent events:");
        for (const auto &event : recent) {
            std::println(out_, "  [{}] at {} | VC: {}", event.type,
                         service::format_timestamp(event.timestamp),
                         clock::format(event.clock));
        }
    }
}

void Menu::show_events() {
    banner(out_, "EVENT LOG WITH CAUSALITY INFORMATION");

    const auto &log = client_.process().log();
    if (log.empty()) {
        std::println(out_, "  No events logged yet.");
        return;
    }

    std::println(out_, "\nTotal events: {}\n\nEvent type summary:", log.size());
    for (const auto &[type, count] : log.summarize_by_type()) {
        std::println(out_, "  {:<20}: {:>3} events", type, count);
    }

    std::println(out_, "\nEvent timeline (last 10 events):\n{}", RULE);
    auto events = log.tail(10);
    auto relations = clock::pairwise_causality(events);
    for (size_t i = 0; i < events.size(); ++i) {
        const auto &event = events[i];
        std::println(out_, "\n{}. [{}] {}", i + 1, event.type, event.id);
        std::println(out_, "   Time: {}",
                     service::format_timestamp(event.timestamp));
        std::println(out_, "   Process: {}", event.process_id);
        std::println(out_, "   Vector clock: {}", clock::format(event.clock));
        std::println(out_, "   Description: {}", event.description);
        if (relations[i]) {
            std::println(out_, "   Relation to prev: {}",
                         describe_relation(*relations[i]));
        }
    }
    std::println(out_, "\n{}", RULE);
}

}  // namespace client
}  // namespace causal
