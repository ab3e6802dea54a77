#include "server.hpp"

#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <causal/logging/core.hpp>
#include <format>
#include <stdexcept>
#include <string>

namespace lg = causal::logging;

namespace causal {
namespace server {

std::string process_id_for(const std::string &name) {
    std::string id = name;
    std::erase(id, ' ');
    return id;
}

Server::Server(const Options &options)
    : options_(options),
      process_(process_id_for(options_.name), options_.roster,
               options_.log_capacity),
      healthservice_impl_(options_.name, process_),
      calculatorservice_impl_(options_.name, process_) {
    process_.record("SERVER_START", "Server initialization");

    grpc::ServerBuilder builder;
    builder.AddListeningPort(options_.address,
                             grpc::InsecureServerCredentials(), &port_);
    builder.RegisterService(&healthservice_impl_);
    builder.RegisterService(&calculatorservice_impl_);
    server_ = builder.BuildAndStart();
    if (!server_ || port_ == 0) {
        throw std::runtime_error(std::format(
            "failed to listen on {}", std::string(options_.address)));
    }

    lg::write(lg::level::info, "{} listening on {}:{}", options_.name,
              options_.address.host, port_);
    lg::write(lg::level::info, "process id {}, initial vc {}", process_.id(),
              process_.clock().format());
}

Server::~Server() {
    shutdown();
}

void Server::wait() {
    server_->Wait();
}

void Server::shutdown() {
    if (server_) {
        server_->Shutdown();
    }
}

}  // namespace server
}  // namespace causal
