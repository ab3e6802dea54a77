#include "service/calculator/impl.hpp"

#include <causal/service/calculator/calculator.pb.h>
#include <grpcpp/server_context.h>

#include <algorithm>
#include <causal/clock/snapshot.hpp>
#include <causal/logging/core.hpp>
#include <causal/service/wire.hpp>
#include <chrono>
#include <format>
#include <stdexcept>
#include <thread>

namespace lg = causal::logging;

int64_t partial_sum(int64_t start, int64_t end) {
    if (start < 1 || end < start) {
        throw std::invalid_argument(
            std::format("invalid range [{}-{}]", start, end));
    }
    if (end > causal::service::MAX_RANGE_END) {
        throw std::invalid_argument(std::format(
            "range end {} exceeds {}", end, causal::service::MAX_RANGE_END));
    }
    return end * (end + 1) / 2 - (start - 1) * start / 2;
}

std::string_view describe_receipt(causal::clock::Relation local_to_received) {
    switch (local_to_received) {
        case causal::clock::Relation::before:
            return "CAUSALLY AFTER (received event happened after local "
                   "state)";
        case causal::clock::Relation::after:
            return "CAUSALLY BEFORE (local state is ahead of received event)";
        case causal::clock::Relation::concurrent:
            break;
    }
    return "CONCURRENT (events happened independently)";
}

namespace causal {
namespace service {
namespace calculator {

Impl::Impl(const std::string &server_name, clock::Process &process)
    : server_name_(server_name), process_(process) {}

Impl::~Impl() = default;

grpc::Status Impl::CalculatePartialSum(grpc::ServerContext *context,
                                       const PartialSumRequest *request,
                                       PartialSumResponse *response) {
    try {
        // rejects bad ranges before the clock sees the message
        int64_t sum = partial_sum(request->start(), request->end());
        clock::Snapshot remote = to_snapshot(request->vector_clock());
        clock::validate(remote);

        auto receipt = process_.receive_event(
            remote, "REQUEST_RECEIVED",
            std::format("Partial sum request [{}-{}] from request {}",
                        request->start(), request->end(),
                        request->request_id()));
        uint64_t count = ++request_count_;

        lg::write(lg::level::info,
                  "CalculatePartialSum #{} request={} range=[{}-{}]", count,
                  request->request_id(), request->start(), request->end());
        lg::write(lg::level::info, "  received vc: {}",
                  clock::format(receipt.remote));
        lg::write(lg::level::info, "  before:      {}",
                  clock::format(receipt.before));
        lg::write(lg::level::info, "  after:       {}",
                  clock::format(receipt.after));
        lg::write(lg::level::info, "  causality:   {}",
                  describe_receipt(receipt.relation));

        // stands in for real work
        int64_t work_ms = (request->end() - request->start() + 1) / 10;
        std::this_thread::sleep_for(
            std::chrono::milliseconds(std::min<int64_t>(work_ms, 100)));

        auto done = process_.record(
            "CALCULATION_COMPLETE",
            std::format("Calculated sum [{}-{}] = {}", request->start(),
                        request->end(), sum));

        response->set_partial_sum(sum);
        response->set_server_name(server_name_);
        response->set_timestamp(format_timestamp(done.timestamp));
        response->set_range_start(request->start());
        response->set_range_end(request->end());
        response->set_request_id(request->request_id());
        write_snapshot(receipt.after, response->mutable_vector_clock());

        lg::write(lg::level::info,
                  "CalculatePartialSum({}, [{}-{}]) -> Ok({}) vc={} "
                  "events={}",
                  request->request_id(), request->start(), request->end(),
                  sum, clock::format(receipt.after), process_.log().size());
        return grpc::Status::OK;
    } catch (const std::invalid_argument &e) {
        lg::write(lg::level::error, "CalculatePartialSum({}, [{}-{}]) -> Err({})",
                  request->request_id(), request->start(), request->end(),
                  e.what());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    } catch (const std::overflow_error &e) {
        lg::write(lg::level::error, "CalculatePartialSum({}, [{}-{}]) -> Err({})",
                  request->request_id(), request->start(), request->end(),
                  e.what());
        return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, e.what());
    } catch (const std::exception &e) {
        lg::write(lg::level::error, "CalculatePartialSum({}, [{}-{}]) -> Err({})",
                  request->request_id(), request->start(), request->end(),
                  e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

uint64_t Impl::request_count() const {
    return request_count_.load();
}

}  // namespace calculator
}  // namespace service
}  // namespace causal
