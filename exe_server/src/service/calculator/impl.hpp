#pragma once

#include <causal/service/calculator/calculator.grpc.pb.h>
#include <causal/service/calculator/calculator.pb.h>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <causal/clock/causality.hpp>
#include <causal/clock/process.hpp>
#include <causal/service/wire.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Sum of the integers in [start, end], 1 <= start <= end <= MAX_RANGE_END.
int64_t partial_sum(int64_t start, int64_t end);

// How the server's clock before a merge relates to the clock it received.
std::string_view describe_receipt(causal::clock::Relation local_to_received);

namespace causal {
namespace service {
namespace calculator {

class Impl final : public CalculatorService::Service {
   public:
    Impl(const std::string &server_name, clock::Process &process);
    ~Impl() override;

    grpc::Status CalculatePartialSum(grpc::ServerContext *context,
                                     const PartialSumRequest *request,
                                     PartialSumResponse *response) override;

    uint64_t request_count() const;

   private:
    std::string server_name_;
    clock::Process &process_;
    std::atomic<uint64_t> request_count_ = 0;
};

}  // namespace calculator
}  // namespace service
}  // namespace causal
