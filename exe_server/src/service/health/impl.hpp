#pragma once

#include <causal/service/health/health.grpc.pb.h>
#include <causal/service/health/health.pb.h>
#include <grpcpp/grpcpp.h>

#include <causal/clock/process.hpp>
#include <chrono>
#include <string>

namespace causal {
namespace service {
namespace health {

// The gRPC service implementation for liveness probes.
class Impl final : public HealthService::Service {
   public:
    Impl(const std::string &server_name, clock::Process &process);
    ~Impl() override;

    grpc::Status HealthCheck(grpc::ServerContext *context,
                             const HealthCheckRequest *request,
                             HealthCheckResponse *response) override;

   private:
    std::string server_name_;
    clock::Process &process_;
    const std::chrono::steady_clock::time_point started_;
};

}  // namespace health
}  // namespace service
}  // namespace causal
