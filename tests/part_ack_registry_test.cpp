// tests/part_ack_registry_test.cpp
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "part_ack_registry.hpp"
#include "upload_errors.hpp"

namespace MultipartUploader {
namespace Session {
namespace test {

TEST(PartAckRegistryTest, ReturnsAcksInAscendingOrderRegardlessOfArrival) {
    PartAckRegistry registry(3);
    registry.record({3, "c"});
    registry.record({1, "a"});
    EXPECT_FALSE(registry.complete());
    registry.record({2, "b"});

    std::vector<Store::PartAck> acks = registry.orderedAcks();
    ASSERT_EQ(acks.size(), 3u);
    EXPECT_EQ(acks[0].part_number, 1);
    EXPECT_EQ(acks[0].etag, "a");
    EXPECT_EQ(acks[1].part_number, 2);
    EXPECT_EQ(acks[2].part_number, 3);
    EXPECT_EQ(acks[2].etag, "c");
}

TEST(PartAckRegistryTest, RejectsDuplicatesAndOutOfRangeParts) {
    PartAckRegistry registry(2);
    registry.record({1, "a"});
    EXPECT_THROW(registry.record({1, "again"}), SessionStateError);
    EXPECT_THROW(registry.record({0, "zero"}), SessionStateError);
    EXPECT_THROW(registry.record({3, "three"}), SessionStateError);
    EXPECT_EQ(registry.count(), 1);
}

TEST(PartAckRegistryTest, IncompleteSetCannotBeFinalized) {
    PartAckRegistry registry(2);
    registry.record({2, "b"});
    EXPECT_THROW(registry.orderedAcks(), SessionStateError);
}

TEST(PartAckRegistryTest, NeedsAtLeastOnePart) {
    EXPECT_THROW({ PartAckRegistry empty(0); }, InvalidInput);
}

TEST(PartAckRegistryTest, ConcurrentRecording) {
    const int parts = 400;
    PartAckRegistry registry(parts);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int part = parts - t; part >= 1; part -= 4) {
                registry.record({part, "etag-" + std::to_string(part)});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<Store::PartAck> acks = registry.orderedAcks();
    ASSERT_EQ(acks.size(), static_cast<size_t>(parts));
    for (int i = 0; i < parts; ++i) {
        EXPECT_EQ(acks[i].part_number, i + 1);
        EXPECT_EQ(acks[i].etag, "etag-" + std::to_string(i + 1));
    }
}

} // namespace test
} // namespace Session
} // namespace MultipartUploader
