#define BOOST_TEST_MODULE ClientTests

#include <boost/test/unit_test.hpp>
#include <causal/clock/causality.hpp>
#include <causal/logging/core.hpp>
#include <causal/service/wire.hpp>
#include <format>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "client.hpp"
#include "menu.hpp"
#include "server.hpp"

using namespace causal;

namespace {

const std::vector<std::string> ROSTER = {"Client", "Server1", "Server2"};

std::unique_ptr<server::Server> start_server(const std::string &name) {
    server::Options options;
    options.name = name;
    options.address = service::Address("localhost", 0);
    options.roster = ROSTER;
    return std::make_unique<server::Server>(options);
}

client::ServerInfo info_for(const std::string &name,
                            const server::Server &server) {
    return {name, service::Address("localhost", server.port())};
}

}  // namespace

struct LoggingFixture {
    LoggingFixture() {
        logging::init(logging::level::error, logging::sink_type::null);
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LoggingFixture);

struct GrpcFixture {
    GrpcFixture() {
        server1 = start_server("Server1");
        server2 = start_server("Server2");

        // a port that was bound once and is closed again
        auto stopped = start_server("Server2");
        down = {"Server2", service::Address("localhost", stopped->port())};
        stopped.reset();

        up1 = info_for("Server1", *server1);
        up2 = info_for("Server2", *server2);
        backend = std::make_unique<client::Client>(
            "Client", ROSTER, std::vector<client::ServerInfo>{up1, up2, down});
    }

    std::unique_ptr<server::Server> server1;
    std::unique_ptr<server::Server> server2;
    client::ServerInfo up1{"", service::Address("", 0)};
    client::ServerInfo up2{"", service::Address("", 0)};
    client::ServerInfo down{"", service::Address("", 0)};
    std::unique_ptr<client::Client> backend;
};

BOOST_AUTO_TEST_SUITE(HelperTests)

BOOST_AUTO_TEST_CASE(test_divide_work_even) {
    auto ranges = client::divide_work(9, 3);
    BOOST_REQUIRE_EQUAL(ranges.size(), 3u);
    BOOST_CHECK_EQUAL(ranges[0].start, 1);
    BOOST_CHECK_EQUAL(ranges[0].end, 3);
    BOOST_CHECK_EQUAL(ranges[1].start, 4);
    BOOST_CHECK_EQUAL(ranges[1].end, 6);
    BOOST_CHECK_EQUAL(ranges[2].start, 7);
    BOOST_CHECK_EQUAL(ranges[2].end, 9);
}

BOOST_AUTO_TEST_CASE(test_divide_work_remainder_goes_first) {
    auto ranges = client::divide_work(10, 3);
    BOOST_REQUIRE_EQUAL(ranges.size(), 3u);
    BOOST_CHECK_EQUAL(ranges[0].size(), 4);
    BOOST_CHECK_EQUAL(ranges[1].size(), 3);
    BOOST_CHECK_EQUAL(ranges[2].size(), 3);
    BOOST_CHECK_EQUAL(ranges[2].end, 10);
}

BOOST_AUTO_TEST_CASE(test_divide_work_more_servers_than_numbers) {
    auto ranges = client::divide_work(2, 3);
    BOOST_REQUIRE_EQUAL(ranges.size(), 3u);
    BOOST_CHECK_EQUAL(ranges[0].size(), 1);
    BOOST_CHECK_EQUAL(ranges[1].size(), 1);
    BOOST_CHECK_EQUAL(ranges[2].size(), 0);
    BOOST_CHECK_THROW(client::divide_work(5, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_parse_server) {
    auto server = client::parse_server("Server2=10.0.0.6:5002");
    BOOST_CHECK_EQUAL(server.name, "Server2");
    BOOST_CHECK_EQUAL(server.address.host, "10.0.0.6");
    BOOST_CHECK_EQUAL(server.address.port, 5002);
    BOOST_CHECK_THROW(client::parse_server("localhost:5001"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(client::parse_server("Server1=localhost"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(client::parse_server("Server1=localhost:http"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_parse_selection) {
    auto selected = client::parse_selection("3, 1,3", 3);
    BOOST_REQUIRE_EQUAL(selected.size(), 2u);
    BOOST_CHECK_EQUAL(selected[0], 2u);
    BOOST_CHECK_EQUAL(selected[1], 0u);
    BOOST_CHECK_THROW(client::parse_selection("4", 3), std::invalid_argument);
    BOOST_CHECK_THROW(client::parse_selection("0", 3), std::invalid_argument);
    BOOST_CHECK_THROW(client::parse_selection("1,,2", 3),
                      std::invalid_argument);
    BOOST_CHECK_THROW(client::parse_selection("one", 3),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_describe_relation) {
    BOOST_CHECK_EQUAL(client::describe_relation(clock::Relation::before),
                      "-> (happened-before)");
    BOOST_CHECK_EQUAL(client::describe_relation(clock::Relation::after),
                      "<- (happened-after)");
    BOOST_CHECK_EQUAL(client::describe_relation(clock::Relation::concurrent),
                      "|| (concurrent)");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ClientTests, GrpcFixture)

BOOST_AUTO_TEST_CASE(test_client_start_is_logged) {
    auto records = backend->process().log().tail(10);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].type, "CLIENT_START");
    BOOST_CHECK_EQUAL(backend->process().clock().format(),
                      "{Client:0, Server1:0, Server2:0}");
    BOOST_CHECK(backend->session_id().starts_with("Client-"));
}

BOOST_AUTO_TEST_CASE(test_available_servers) {
    BOOST_CHECK(backend->is_available(up1));
    BOOST_CHECK(!backend->is_available(down));

    auto available = backend->available_servers();
    BOOST_REQUIRE_EQUAL(available.size(), 2u);
    BOOST_CHECK(available[0].address == up1.address);
    BOOST_CHECK(available[1].address == up2.address);
    // probes are not client events
    BOOST_CHECK_EQUAL(backend->process().clock().value_of("Client"), 0);
}

BOOST_AUTO_TEST_CASE(test_check_health) {
    auto reports = backend->check_health();
    BOOST_REQUIRE_EQUAL(reports.size(), 3u);
    BOOST_CHECK(reports[0].reachable && reports[0].healthy);
    BOOST_CHECK(reports[1].reachable && reports[1].healthy);
    BOOST_CHECK(!reports[2].reachable);
    BOOST_CHECK(!reports[2].error.empty());
    BOOST_CHECK_EQUAL(reports[0].server_clock.at("Server1"), 1);

    BOOST_CHECK_EQUAL(backend->process().clock().value_of("Client"), 1);
    auto summary = backend->process().log().summarize_by_type();
    BOOST_CHECK_EQUAL(summary["HEALTH_CHECK"], 1u);
}

BOOST_AUTO_TEST_CASE(test_calculate_across_servers) {
    auto calculation = backend->calculate(100, {up1, up2}, "Auto mode");

    BOOST_CHECK_EQUAL(calculation.n, 100);
    BOOST_CHECK_EQUAL(calculation.server_count, 2u);
    BOOST_CHECK_EQUAL(calculation.total, 5050);
    BOOST_CHECK(calculation.verified());
    BOOST_CHECK(calculation.failures.empty());
    BOOST_CHECK_EQUAL(calculation.request_id.size(), 8u);

    BOOST_REQUIRE_EQUAL(calculation.results.size(), 2u);
    const auto &first = calculation.results[0];
    const auto &second = calculation.results[1];
    BOOST_CHECK_EQUAL(first.range.start, 1);
    BOOST_CHECK_EQUAL(first.range.end, 50);
    BOOST_CHECK_EQUAL(first.partial_sum, 1275);
    BOOST_CHECK_EQUAL(second.partial_sum, 3775);

    // both requests carry the clock right after REQUEST_INIT
    BOOST_CHECK_EQUAL(clock::format(first.sent),
                      "{Client:1, Server1:0, Server2:0}");
    BOOST_CHECK(first.sent == second.sent);
    BOOST_CHECK_EQUAL(clock::format(first.received),
                      "{Client:1, Server1:1, Server2:0}");
    BOOST_CHECK_EQUAL(clock::format(second.received),
                      "{Client:1, Server1:0, Server2:1}");
    BOOST_CHECK(first.relation == clock::Relation::before);
    BOOST_CHECK(second.relation == clock::Relation::before);

    // one tick for REQUEST_INIT and one per merged reply
    BOOST_CHECK_EQUAL(clock::format(calculation.final_clock),
                      "{Client:3, Server1:1, Server2:1}");

    auto records = backend->process().log().tail(10);
    std::vector<std::string> types;
    for (const auto &record : records) {
        types.push_back(record.type);
    }
    std::vector<std::string> expected = {"CLIENT_START", "REQUEST_INIT",
                                         "RESPONSE_RECEIVED",
                                         "RESPONSE_RECEIVED",
                                         "CALCULATION_COMPLETE"};
    BOOST_CHECK_EQUAL_COLLECTIONS(types.begin(), types.end(),
                                  expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_failed_call_leaves_clock_untouched) {
    auto calculation = backend->calculate(10, {up1, down}, "Manual: 1,3");

    BOOST_REQUIRE_EQUAL(calculation.results.size(), 1u);
    BOOST_REQUIRE_EQUAL(calculation.failures.size(), 1u);
    BOOST_CHECK_EQUAL(calculation.total, 15);
    BOOST_CHECK_EQUAL(calculation.failures[0].range.start, 6);
    BOOST_CHECK(!calculation.verified());
    BOOST_CHECK_EQUAL(clock::format(calculation.final_clock),
                      "{Client:2, Server1:1, Server2:0}");
}

BOOST_AUTO_TEST_CASE(test_all_calls_failing) {
    auto calculation = backend->calculate(10, {down}, "Manual: 3");

    BOOST_CHECK(calculation.results.empty());
    BOOST_CHECK_EQUAL(calculation.failures.size(), 1u);
    BOOST_CHECK_EQUAL(clock::format(calculation.final_clock),
                      "{Client:1, Server1:0, Server2:0}");
    auto summary = backend->process().log().summarize_by_type();
    BOOST_CHECK_EQUAL(summary.count("CALCULATION_COMPLETE"), 0u);
}

BOOST_AUTO_TEST_CASE(test_saturated_reply_clock_is_a_failure) {
    constexpr clock::Counter top = std::numeric_limits<clock::Counter>::max();
    {
        // leaves Server1 carrying Client=max, which it echoes on every reply
        auto channel =
            grpc::CreateChannel(std::format("localhost:{}", server1->port()),
                                grpc::InsecureChannelCredentials());
        auto stub = service::calculator::CalculatorService::NewStub(channel);
        grpc::ClientContext context;
        service::calculator::PartialSumRequest request;
        request.set_start(1);
        request.set_end(1);
        request.set_request_id("seed");
        service::write_snapshot({{"Client", top}},
                                request.mutable_vector_clock());
        service::calculator::PartialSumResponse response;
        BOOST_REQUIRE(
            stub->CalculatePartialSum(&context, request, &response).ok());
    }

    auto calculation = backend->calculate(10, {up1}, "Manual: 1");

    BOOST_CHECK(calculation.results.empty());
    BOOST_REQUIRE_EQUAL(calculation.failures.size(), 1u);
    BOOST_CHECK(calculation.failures[0].error.starts_with(
        "rejected vector clock"));
    BOOST_CHECK_EQUAL(clock::format(calculation.final_clock),
                      "{Client:1, Server1:0, Server2:0}");
    auto summary = backend->process().log().summarize_by_type();
    BOOST_CHECK_EQUAL(summary.count("RESPONSE_RECEIVED"), 0u);
    BOOST_CHECK_EQUAL(summary.count("CALCULATION_COMPLETE"), 0u);
}

BOOST_AUTO_TEST_CASE(test_calculate_rejects_bad_input) {
    BOOST_CHECK_THROW(backend->calculate(0, {up1}, "Auto mode"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(backend->calculate(10, {}, "Auto mode"),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(backend->process().log().size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_fewer_numbers_than_servers) {
    auto calculation = backend->calculate(1, {up1, up2}, "Auto mode");
    BOOST_CHECK_EQUAL(calculation.server_count, 1u);
    BOOST_CHECK_EQUAL(calculation.total, 1);
    BOOST_CHECK(calculation.verified());
}

BOOST_AUTO_TEST_CASE(test_menu_session) {
    std::istringstream in("1\n100\n4\n5\n9\n0\n");
    std::ostringstream out;
    client::Menu menu(*backend, in, out);
    menu.run();

    std::string text = out.str();
    BOOST_CHECK(text.find("Verification: CORRECT!") != std::string::npos);
    BOOST_CHECK(text.find("VECTOR CLOCK STATE & ANALYSIS") !=
                std::string::npos);
    BOOST_CHECK(text.find("Relation to prev: -> (happened-before)") !=
                std::string::npos);
    BOOST_CHECK(text.find("Invalid selection.") != std::string::npos);

    auto records = backend->process().log().tail(1);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].type, "CLIENT_STOP");
}

BOOST_AUTO_TEST_CASE(test_menu_stops_at_end_of_input) {
    std::istringstream in("2\n1,3\n");
    std::ostringstream out;
    client::Menu menu(*backend, in, out);
    menu.run();

    std::string text = out.str();
    BOOST_CHECK(text.find("Warning: Server2 is offline") != std::string::npos);
    BOOST_CHECK_EQUAL(backend->process().log().tail(1)[0].type, "CLIENT_STOP");
}

BOOST_AUTO_TEST_SUITE_END()
