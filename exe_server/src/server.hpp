#pragma once

#include <grpcpp/grpcpp.h>

#include <causal/clock/process.hpp>
#include <causal/service/wire.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "service/calculator/impl.hpp"
#include "service/health/impl.hpp"

namespace causal {
namespace server {

const std::vector<std::string> DEFAULT_ROSTER = {"Client", "Server1",
                                                 "Server2", "Server3"};

struct Options {
    std::string name = "Server1";
    service::Address address{"0.0.0.0", 5001};
    std::vector<std::string> roster = DEFAULT_ROSTER;
    std::optional<size_t> log_capacity;
};

// Process id for a server name: the name with its spaces removed.
std::string process_id_for(const std::string &name);

/* One calculator process: its clock and event log, and the gRPC services that
   share them. Listens as soon as it is constructed. */
class Server {
   public:
    explicit Server(const Options &options);
    ~Server();

    void wait();
    void shutdown();

    // The bound port; differs from the configured one when that was 0.
    int port() const {
        return port_;
    }

    clock::Process &process() {
        return process_;
    }

    const service::calculator::Impl &calculator() const {
        return calculatorservice_impl_;
    }

   private:
    Options options_;
    clock::Process process_;
    service::health::Impl healthservice_impl_;
    service::calculator::Impl calculatorservice_impl_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;
};

}  // namespace server
}  // namespace causal
