#include <gtest/gtest.h>
#include "SharedBuffer.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace deck;

TEST(SharedBufferTest, DrainsInFifoOrderAndZeroFillsShortReads) {
    SharedBuffer buffer(4);
    std::vector<float> a{1.0f, 2.0f, 3.0f};
    buffer.push(a);

    std::vector<float> out(5, -1.0f);
    EXPECT_EQ(buffer.drain(out), 3u);
    EXPECT_EQ(out, (std::vector<float>{1.0f, 2.0f, 3.0f, 0.0f, 0.0f}));
    EXPECT_TRUE(buffer.empty());
}

TEST(SharedBufferTest, EmptyDrainIsSilence) {
    SharedBuffer buffer;
    std::vector<float> out(8, 0.7f);
    EXPECT_EQ(buffer.drain(out), 0u);
    for (float s : out) EXPECT_EQ(s, 0.0f);
}

TEST(SharedBufferTest, GrowsAcrossWrapAround) {
    SharedBuffer buffer(4);
    std::vector<float> first{1.0f, 2.0f, 3.0f};
    buffer.push(first);
    std::vector<float> two(2);
    buffer.drain(two); // head now at 2

    std::vector<float> more{4.0f, 5.0f, 6.0f, 7.0f, 8.0f};
    buffer.push(more); // Grows while the head sits mid-ring
    EXPECT_GE(buffer.capacity(), 6u);
    EXPECT_EQ(buffer.size(), 6u);

    std::vector<float> out(6);
    EXPECT_EQ(buffer.drain(out), 6u);
    EXPECT_EQ(out, (std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f, 7.0f, 8.0f}));
}

TEST(SharedBufferTest, PausedDrainKeepsSamples) {
    SharedBuffer buffer;
    std::vector<float> in{0.5f, 0.5f};
    buffer.push(in);
    buffer.set_paused(true);

    std::vector<float> out(2, 1.0f);
    EXPECT_EQ(buffer.drain(out), 0u);
    EXPECT_EQ(out[0], 0.0f);
    EXPECT_EQ(buffer.size(), 2u);

    buffer.set_paused(false);
    EXPECT_EQ(buffer.drain(out), 2u);
    EXPECT_EQ(out[1], 0.5f);
}

TEST(SharedBufferTest, ClearDropsEverything) {
    SharedBuffer buffer;
    std::vector<float> in(100, 1.0f);
    buffer.push(in);
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
}

TEST(SharedBufferTest, ConcurrentProducerConsumerPreservesOrder) {
    SharedBuffer buffer(16);
    constexpr size_t total = 200000;
    std::atomic<bool> done{false};
    std::vector<float> received;
    received.reserve(total);

    std::thread consumer([&] {
        std::vector<float> block(64);
        while (received.size() < total) {
            const size_t taken = buffer.drain(block);
            received.insert(received.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(taken));
            if (taken == 0 && done && buffer.empty()) break;
        }
    });

    std::vector<float> chunk;
    for (size_t next = 0; next < total;) {
        chunk.clear();
        const size_t n = std::min<size_t>(1 + next % 97, total - next);
        for (size_t i = 0; i < n; ++i) chunk.push_back(static_cast<float>(next + i));
        buffer.push(chunk);
        next += n;
    }
    done = true;
    consumer.join();

    ASSERT_EQ(received.size(), total);
    for (size_t i = 0; i < total; ++i) {
        ASSERT_EQ(received[i], static_cast<float>(i)) << "at " << i;
    }
}
