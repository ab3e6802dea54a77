#include "client.hpp"

#include <grpcpp/client_context.h>

#include <causal/clock/event_log.hpp>
#include <causal/logging/core.hpp>
#include <format>
#include <future>
#include <stdexcept>
#include <utility>

namespace lg = causal::logging;
namespace calc = causal::service::calculator;
namespace health = causal::service::health;

namespace causal {
namespace client {

namespace {

constexpr auto PROBE_DEADLINE = std::chrono::seconds(1);
constexpr auto HEALTH_DEADLINE = std::chrono::seconds(2);
constexpr auto CALCULATE_DEADLINE = std::chrono::seconds(10);

struct Outcome {
    grpc::Status status;
    calc::PartialSumResponse response;
};

}  // namespace

std::vector<ServerInfo> default_servers() {
    return {
        {"Server1", service::Address("localhost", 5001)},
        {"Server2", service::Address("localhost", 5002)},
        {"Server3", service::Address("localhost", 5003)},
    };
}

ServerInfo parse_server(const std::string &text) {
    auto equals = text.find('=');
    if (equals == std::string::npos || equals == 0) {
        throw std::invalid_argument(
            std::format("expected name=host:port, got '{}'", text));
    }
    return {text.substr(0, equals),
            service::Address::parse(text.substr(equals + 1))};
}

std::vector<Range> divide_work(int64_t n, size_t count) {
    if (count == 0) {
        throw std::invalid_argument("cannot divide work across 0 servers");
    }
    std::vector<Range> ranges;
    ranges.reserve(count);
    int64_t per_server = n / static_cast<int64_t>(count);
    int64_t remainder = n % static_cast<int64_t>(count);
    int64_t start = 1;
    for (size_t i = 0; i < count; ++i) {
        int64_t size = per_server + (static_cast<int64_t>(i) < remainder);
        ranges.push_back({start, start + size - 1});
        start += size;
    }
    return ranges;
}

int64_t Calculation::expected() const {
    return n * (n + 1) / 2;
}

bool Calculation::verified() const {
    return failures.empty() && total == expected();
}

Client::Client(const std::string &id, const std::vector<std::string> &roster,
               std::vector<ServerInfo> servers)
    : servers_(std::move(servers)),
      process_(id, roster),
      session_id_(std::format("{}-{}", id, clock::make_event_id())) {
    for (const auto &server : servers_) {
        if (stubs_.contains(server.address)) {
            continue;
        }
        Stubs stubs;
        stubs.channel = grpc::CreateChannel(
            server.address, grpc::InsecureChannelCredentials());
        stubs.health = health::HealthService::NewStub(stubs.channel);
        stubs.calculator = calc::CalculatorService::NewStub(stubs.channel);
        stubs_.emplace(server.address, std::move(stubs));
    }
    process_.record("CLIENT_START", "Client application started");
}

const Client::Stubs &Client::stubs_for(const ServerInfo &server) const {
    auto it = stubs_.find(server.address);
    if (it == stubs_.end()) {
        throw std::invalid_argument(std::format(
            "{} ({}) is not a configured server", server.name,
            std::string(server.address)));
    }
    return it->second;
}

bool Client::is_available(const ServerInfo &server) const {
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + PROBE_DEADLINE);
    health::HealthCheckRequest request;
    request.set_client_id(session_id_);
    health::HealthCheckResponse response;
    grpc::Status status =
        stubs_for(server).health->HealthCheck(&context, request, &response);
    if (!status.ok()) {
        lg::write(lg::level::debug, "HealthCheck({}) -> Err({})", server.name,
                  status.error_message());
        return false;
    }
    return response.is_healthy();
}

std::vector<ServerInfo> Client::available_servers() const {
    std::vector<ServerInfo> available;
    for (const auto &server : servers_) {
        if (is_available(server)) {
            available.push_back(server);
        }
    }
    return available;
}

std::vector<HealthReport> Client::check_health() {
    process_.local_event("HEALTH_CHECK", "Checking all servers");

    std::vector<HealthReport> reports;
    for (const auto &server : servers_) {
        HealthReport report{.server = server};

        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() +
                             HEALTH_DEADLINE);
        health::HealthCheckRequest request;
        request.set_client_id(session_id_);
        health::HealthCheckResponse response;
        grpc::Status status = stubs_for(server).health->HealthCheck(
            &context, request, &response);
        if (status.ok()) {
            report.reachable = true;
            report.healthy = response.is_healthy();
            report.uptime_seconds = response.uptime_seconds();
            report.server_clock = service::to_snapshot(response.vector_clock());
            lg::write(lg::level::info, "HealthCheck({}) -> Ok({}, {}s)",
                      server.name, report.healthy, report.uptime_seconds);
        } else {
            report.error = status.error_message();
            lg::write(lg::level::error, "HealthCheck({}) -> Err({})",
                      server.name, report.error);
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

Calculation Client::calculate(int64_t n,
                              const std::vector<ServerInfo> &servers,
                              const std::string &mode) {
    if (n < 1 || n > service::MAX_RANGE_END) {
        throw std::invalid_argument(std::format(
            "n must be between 1 and {}, got {}", service::MAX_RANGE_END, n));
    }
    if (servers.empty()) {
        throw std::invalid_argument("no servers to calculate with");
    }

    process_.local_event("REQUEST_INIT",
                         std::format("Initiating calculation for n={} ({})",
                                     n, mode));

    Calculation calculation;
    calculation.request_id = clock::make_event_id();
    calculation.n = n;

    auto started = std::chrono::steady_clock::now();
    auto ranges = divide_work(n, servers.size());

    struct Pending {
        ServerInfo server;
        Range range;
        clock::Snapshot sent;
        std::future<Outcome> outcome;
    };
    std::vector<Pending> pending;
    for (size_t i = 0; i < servers.size(); ++i) {
        if (ranges[i].size() == 0) {
            continue;
        }
        calc::CalculatorService::Stub *stub =
            stubs_for(servers[i]).calculator.get();

        calc::PartialSumRequest request;
        request.set_start(ranges[i].start);
        request.set_end(ranges[i].end);
        request.set_request_id(calculation.request_id);
        clock::Snapshot sent = process_.clock().snapshot();
        service::write_snapshot(sent, request.mutable_vector_clock());

        lg::write(lg::level::debug, "CalculatePartialSum({}, [{}-{}]) vc={}",
                  servers[i].name, ranges[i].start, ranges[i].end,
                  clock::format(sent));

        auto outcome =
            std::async(std::launch::async, [stub, request = std::move(request)] {
                Outcome outcome;
                grpc::ClientContext context;
                context.set_deadline(std::chrono::system_clock::now() +
                                     CALCULATE_DEADLINE);
                outcome.status = stub->CalculatePartialSum(&context, request,
                                                           &outcome.response);
                return outcome;
            });
        pending.push_back({servers[i], ranges[i], std::move(sent),
                           std::move(outcome)});
    }
    calculation.server_count = pending.size();

    // replies are merged in range order, not arrival order
    for (auto &call : pending) {
        Outcome outcome = call.outcome.get();
        if (!outcome.status.ok()) {
            lg::write(lg::level::error,
                      "CalculatePartialSum({}, [{}-{}]) -> Err({})",
                      call.server.name, call.range.start, call.range.end,
                      outcome.status.error_message());
            calculation.failures.push_back(
                {call.server, call.range, outcome.status.error_message()});
            continue;
        }

        const auto &response = outcome.response;
        clock::Snapshot received = service::to_snapshot(response.vector_clock());
        try {
            clock::validate(received);
            process_.receive_event(
                received, "RESPONSE_RECEIVED",
                std::format("Partial sum [{}-{}] = {} from {}",
                            response.range_start(), response.range_end(),
                            response.partial_sum(), call.server.name));
        } catch (const std::invalid_argument &e) {
            lg::write(lg::level::error,
                      "CalculatePartialSum({}, [{}-{}]) -> Err(bad clock {}: "
                      "{})",
                      call.server.name, call.range.start, call.range.end,
                      clock::format(received), e.what());
            calculation.failures.push_back({call.server, call.range,
                                            std::format("rejected vector "
                                                        "clock: {}",
                                                        e.what())});
            continue;
        } catch (const std::overflow_error &e) {
            lg::write(lg::level::error,
                      "CalculatePartialSum({}, [{}-{}]) -> Err(bad clock {}: "
                      "{})",
                      call.server.name, call.range.start, call.range.end,
                      clock::format(received), e.what());
            calculation.failures.push_back({call.server, call.range,
                                            std::format("rejected vector "
                                                        "clock: {}",
                                                        e.what())});
            continue;
        }

        lg::write(lg::level::info,
                  "CalculatePartialSum({}, [{}-{}]) -> Ok({})",
                  call.server.name, call.range.start, call.range.end,
                  response.partial_sum());

        calculation.total += response.partial_sum();
        calculation.results.push_back({
            .server = call.server,
            .range = call.range,
            .partial_sum = response.partial_sum(),
            .timestamp = response.timestamp(),
            .sent = call.sent,
            .received = received,
            .relation = clock::relate(call.sent, received),
        });
    }

    calculation.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!calculation.results.empty()) {
        process_.record("CALCULATION_COMPLETE",
                        std::format("Completed calculation for n={}, "
                                    "result={}",
                                    n, calculation.total));
    }
    calculation.final_clock = process_.clock().snapshot();
    return calculation;
}

}  // namespace client
}  // namespace causal
