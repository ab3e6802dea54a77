#include "service/health/impl.hpp"

#include <causal/service/health/health.pb.h>
#include <grpcpp/grpcpp.h>

#include <causal/clock/snapshot.hpp>
#include <causal/logging/core.hpp>
#include <causal/service/wire.hpp>
#include <format>

namespace lg = causal::logging;

namespace causal {
namespace service {
namespace health {

Impl::Impl(const std::string &server_name, clock::Process &process)
    : server_name_(server_name),
      process_(process),
      started_(std::chrono::steady_clock::now()) {}

Impl::~Impl() = default;

grpc::Status Impl::HealthCheck(grpc::ServerContext *context,
                               const HealthCheckRequest *request,
                               HealthCheckResponse *response) {
    try {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started_);
        auto record = process_.local_event(
            "HEALTH_CHECK",
            std::format("Health check from {}", request->client_id()));

        response->set_is_healthy(true);
        response->set_server_name(server_name_);
        response->set_uptime_seconds(uptime.count());
        write_snapshot(record.clock, response->mutable_vector_clock());

        lg::write(lg::level::info, "HealthCheck({}) -> Ok(uptime={}s, vc={})",
                  request->client_id(), uptime.count(),
                  clock::format(record.clock));
        return grpc::Status::OK;
    } catch (const std::exception &e) {
        lg::write(lg::level::error, "HealthCheck({}) -> Err({})",
                  request->client_id(), e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

}  // namespace health
}  // namespace service
}  // namespace causal
