#include "causal/clock/process.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace causal::clock;

namespace {
const std::vector<std::string> roster = {"Client", "Server1", "Server2"};
}

TEST(process_Process, LocalEventTicksAndLogs) {
    Process process("Client", roster);
    auto record = process.local_event("REQUEST_INIT", "n=100");
    EXPECT_EQ(record.clock.at("Client"), 1);
    EXPECT_EQ(process.clock().value_of("Client"), 1);
    EXPECT_EQ(process.log().size(), 1u);
    EXPECT_EQ(process.log().tail(1)[0].id, record.id);
}

TEST(process_Process, RecordDoesNotTick) {
    Process process("Server1", roster);
    auto record = process.record("SERVER_START", "up");
    EXPECT_EQ(record.clock.at("Server1"), 0);
    EXPECT_EQ(process.clock().value_of("Server1"), 0);
    EXPECT_EQ(process.log().size(), 1u);
}

TEST(process_Process, ReceiveEventReportsBeforeAndAfter) {
    Process client("Client", roster);
    Process server("Server1", roster);

    Snapshot sent = client.local_event("REQUEST_INIT", "").clock;
    auto receipt = server.receive_event(sent, "REQUEST_RECEIVED", "");

    EXPECT_EQ(format(receipt.remote), "{Client:1, Server1:0, Server2:0}");
    EXPECT_EQ(format(receipt.before), "{Client:0, Server1:0, Server2:0}");
    EXPECT_EQ(format(receipt.after), "{Client:1, Server1:1, Server2:0}");
    EXPECT_EQ(receipt.relation, Relation::before);
    EXPECT_EQ(receipt.record.clock, receipt.after);
    EXPECT_EQ(compare(receipt.after, sent), 1);
}

TEST(process_Process, ReceiveFromBehindIsReportedAsAfter) {
    Process server("Server1", roster);
    server.local_event("HEALTH_CHECK", "");
    server.local_event("HEALTH_CHECK", "");
    auto receipt = server.receive_event(
        {{"Client", 0}, {"Server1", 1}, {"Server2", 0}}, "REQUEST_RECEIVED",
        "");
    EXPECT_EQ(receipt.relation, Relation::after);
    EXPECT_EQ(receipt.after.at("Server1"), 3);
}

TEST(process_Process, LogOrderFollowsClockOrder) {
    Process process("Server1", roster);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&process, t] {
            for (Counter i = 0; i < 200; ++i) {
                if (t % 2 == 0) {
                    process.local_event("LOCAL", "");
                } else {
                    process.receive_event({{"Client", i}}, "RECEIVE", "");
                }
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    auto records = process.log().tail(process.log().size());
    ASSERT_EQ(records.size(), 800u);
    for (size_t i = 1; i < records.size(); ++i) {
        EXPECT_EQ(records[i].clock.at("Server1"),
                  records[i - 1].clock.at("Server1") + 1);
    }
    for (const auto &relation : pairwise_causality(records)) {
        if (relation) {
            EXPECT_EQ(*relation, Relation::before);
        }
    }
}
