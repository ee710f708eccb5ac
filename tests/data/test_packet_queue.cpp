#include "paddock/data/packet_queue.hpp"
#include "paddock/protocol/dispatcher.hpp"
#include "support/packet_writer.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace paddock::data;

TEST(SPSCQueue, PushPop) {
    SPSCQueue<int> q(4);
    EXPECT_TRUE(q.try_push(42));
    auto val = q.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(*val, 42);
    EXPECT_TRUE(q.empty());
}

TEST(SPSCQueue, PopFromEmpty) {
    SPSCQueue<int> q(4);
    EXPECT_FALSE(q.try_pop().has_value());
}

TEST(SPSCQueue, CapacityIsUsable) {
    SPSCQueue<int> q(3);
    EXPECT_EQ(q.capacity(), 3u);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_TRUE(q.try_push(3));
    EXPECT_FALSE(q.try_push(4));
    EXPECT_FALSE(q.try_push(5));
    EXPECT_EQ(q.dropped(), 2u);
    EXPECT_EQ(q.size_approx(), 3u);
}

TEST(SPSCQueue, ZeroCapacityRejected) {
    EXPECT_THROW(SPSCQueue<int>(0), std::invalid_argument);
}

TEST(SPSCQueue, WrapAroundKeepsOrder) {
    SPSCQueue<int> q(3);
    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 3; ++i) {
            EXPECT_TRUE(q.try_push(round * 10 + i));
        }
        for (int i = 0; i < 3; ++i) {
            EXPECT_EQ(q.try_pop().value_or(-1), round * 10 + i);
        }
    }
    EXPECT_EQ(q.dropped(), 0u);
}

TEST(SPSCQueue, DrainMovesEverything) {
    SPSCQueue<std::string> q(8);
    q.try_push("a");
    q.try_push("b");
    std::vector<std::string> out;
    EXPECT_EQ(q.drain(out), 2u);
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(q.empty());
}

TEST(PacketQueue, CarriesDecodedPackets) {
    using namespace paddock::protocol;
    PacketQueue q(2);
    EXPECT_TRUE(q.try_push(decode_packet(paddock::test::make_datagram(PacketId::Event))));
    auto packet = q.try_pop();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->id(), PacketId::Event);
}

TEST(SPSCQueue, MultithreadedStress) {
    constexpr int kCount = 10000;
    SPSCQueue<int> q(255);

    std::thread producer([&] {
        for (int i = 0; i < kCount; ++i) {
            while (!q.try_push(i)) {
                // spin
            }
        }
    });

    std::vector<int> received;
    received.reserve(kCount);
    std::thread consumer([&] {
        while (static_cast<int>(received.size()) < kCount) {
            if (auto v = q.try_pop()) {
                received.push_back(*v);
            }
        }
    });

    producer.join();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(received[i], i) << "Mismatch at index " << i;
    }
}
