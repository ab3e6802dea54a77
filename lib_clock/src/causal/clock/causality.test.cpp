#include "causal/clock/causality.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "causal/clock/vector_clock.hpp"

using namespace causal::clock;

TEST(causality, ExchangeBetweenTwoProcesses) {
    VectorClock p1("P1", {"P1", "P2"});
    VectorClock p2("P2", {"P1", "P2"});

    Snapshot sent = p1.increment();
    EXPECT_EQ(format(sent), "{P1:1, P2:0}");

    Snapshot received = p2.merge(sent);
    EXPECT_EQ(format(received), "{P1:1, P2:1}");

    EXPECT_EQ(compare(received, sent), 1);
    EXPECT_EQ(compare(sent, received), -1);
    EXPECT_TRUE(happened_after(received, sent));
    EXPECT_TRUE(happened_before(sent, received));
}

TEST(causality, IndependentIncrementsAreConcurrent) {
    VectorClock p1("P1", {"P1", "P2"});
    VectorClock p2("P2", {"P1", "P2"});
    Snapshot a = p1.increment();
    Snapshot b = p2.increment();

    EXPECT_TRUE(is_concurrent(a, b));
    EXPECT_TRUE(is_concurrent(b, a));
    EXPECT_EQ(compare(a, b), 0);
    EXPECT_EQ(relate(b, a), Relation::concurrent);
}

TEST(causality, Irreflexive) {
    std::vector<Snapshot> samples = {
        {}, {{"P1", 0}}, {{"P1", 3}, {"P2", 1}}, {{"A", 0}, {"B", 9}}};
    for (const auto &s : samples) {
        EXPECT_FALSE(happened_before(s, s)) << format(s);
        EXPECT_TRUE(is_concurrent(s, s)) << format(s);
        EXPECT_EQ(compare(s, s), 0) << format(s);
    }
}

TEST(causality, TransitiveAlongACausalChain) {
    VectorClock p1("P1", {"P1", "P2", "P3"});
    VectorClock p2("P2", {"P1", "P2", "P3"});
    VectorClock p3("P3", {"P1", "P2", "P3"});

    Snapshot a = p1.increment();
    Snapshot b = p2.merge(a);
    Snapshot c = p3.merge(b);

    EXPECT_TRUE(happened_before(a, b));
    EXPECT_TRUE(happened_before(b, c));
    EXPECT_TRUE(happened_before(a, c));
}

TEST(causality, ExactlyOneRelationHolds) {
    std::vector<Snapshot> samples;
    for (Counter x = 0; x < 3; ++x) {
        for (Counter y = 0; y < 3; ++y) {
            for (Counter z = 0; z < 3; ++z) {
                samples.push_back({{"A", x}, {"B", y}, {"C", z}});
            }
        }
    }
    for (const auto &a : samples) {
        for (const auto &b : samples) {
            int holds = happened_before(a, b) + happened_before(b, a) +
                        is_concurrent(a, b);
            EXPECT_EQ(holds, 1) << format(a) << " vs " << format(b);
        }
    }
}

TEST(causality, MissingKeysAreSkippedNotZero) {
    // Read as zero, B:0 < B:5 would make a come before b.
    Snapshot a = {{"A", 1}};
    Snapshot b = {{"A", 1}, {"B", 5}};
    EXPECT_FALSE(happened_before(a, b));
    EXPECT_TRUE(is_concurrent(a, b));

    Snapshot c = {{"A", 0}, {"C", 7}};
    EXPECT_TRUE(happened_before(c, b));
    EXPECT_TRUE(happened_after(b, c));
}

TEST(causality, DisjointSnapshotsAreConcurrent) {
    Snapshot a = {{"A", 1}};
    Snapshot b = {{"B", 2}};
    EXPECT_FALSE(happened_before(a, b));
    EXPECT_FALSE(happened_before(b, a));
    EXPECT_EQ(relate(a, b), Relation::concurrent);
    EXPECT_EQ(relate(Snapshot{}, b), Relation::concurrent);
}

TEST(causality, RelationNames) {
    EXPECT_EQ(to_string(Relation::before), "happened-before");
    EXPECT_EQ(to_string(Relation::after), "happened-after");
    EXPECT_EQ(to_string(Relation::concurrent), "concurrent");
    EXPECT_EQ(symbol(Relation::before), "->");
    EXPECT_EQ(symbol(Relation::after), "<-");
    EXPECT_EQ(symbol(Relation::concurrent), "||");
}
