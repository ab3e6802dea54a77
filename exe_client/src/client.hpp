#pragma once

#include <causal/service/calculator/calculator.grpc.pb.h>
#include <causal/service/health/health.grpc.pb.h>
#include <grpcpp/grpcpp.h>

#include <causal/clock/causality.hpp>
#include <causal/clock/process.hpp>
#include <causal/clock/snapshot.hpp>
#include <causal/service/wire.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace causal {
namespace client {

struct ServerInfo {
    std::string name;
    service::Address address;
};

// Server1..3 on localhost:5001..5003.
std::vector<ServerInfo> default_servers();

// name=host:port; throws std::invalid_argument when malformed.
ServerInfo parse_server(const std::string &text);

struct Range {
    int64_t start;
    int64_t end;

    int64_t size() const {
        return end - start + 1;
    }
};

/* Splits [1, n] into count consecutive ranges. The first n % count ranges
   are one longer than the rest, so ranges may be empty when count > n. */
std::vector<Range> divide_work(int64_t n, size_t count);

struct HealthReport {
    ServerInfo server;
    bool reachable = false;
    bool healthy = false;
    int64_t uptime_seconds = 0;
    clock::Snapshot server_clock;
    std::string error;
};

struct PartialResult {
    ServerInfo server;
    Range range;
    int64_t partial_sum = 0;
    std::string timestamp;
    clock::Snapshot sent;
    clock::Snapshot received;
    // sent relative to received
    clock::Relation relation = clock::Relation::concurrent;
};

struct PartialFailure {
    ServerInfo server;
    Range range;
    std::string error;
};

struct Calculation {
    std::string request_id;
    int64_t n = 0;
    size_t server_count = 0;
    std::vector<PartialResult> results;
    std::vector<PartialFailure> failures;
    int64_t total = 0;
    std::chrono::milliseconds elapsed{0};
    clock::Snapshot final_clock;

    int64_t expected() const;
    bool verified() const;
};

/* Console-side participant: owns the client's Process and one stub pair per
   configured server. Failed calls never touch the clock. */
class Client {
   public:
    Client(const std::string &id, const std::vector<std::string> &roster,
           std::vector<ServerInfo> servers);

    const std::vector<ServerInfo> &servers() const {
        return servers_;
    }

    const std::string &session_id() const {
        return session_id_;
    }

    clock::Process &process() {
        return process_;
    }

    bool is_available(const ServerInfo &server) const;
    std::vector<ServerInfo> available_servers() const;

    std::vector<HealthReport> check_health();

    /* Sums 1..n across the given servers in parallel. Throws
       std::invalid_argument for n outside [1, MAX_RANGE_END] or an empty
       server list. A reply whose clock fails validation or would overflow
       the client's counter becomes a PartialFailure and is not merged. */
    Calculation calculate(int64_t n, const std::vector<ServerInfo> &servers,
                          const std::string &mode);

   private:
    struct Stubs {
        std::shared_ptr<grpc::Channel> channel;
        std::unique_ptr<service::health::HealthService::Stub> health;
        std::unique_ptr<service::calculator::CalculatorService::Stub>
            calculator;
    };

    const Stubs &stubs_for(const ServerInfo &server) const;

    std::vector<ServerInfo> servers_;
    std::map<service::Address, Stubs> stubs_;
    clock::Process process_;
    std::string session_id_;
};

}  // namespace client
}  // namespace causal
