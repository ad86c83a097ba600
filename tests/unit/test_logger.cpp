#include <gtest/gtest.h>
#include "Logger.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <cstring>
#include <sstream>
#include <thread>
#include <vector>

using namespace deck;

TEST(LoggerTest, SingleThreadedPushPop) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    logger.log_message("DEVICE", "ALSA recovered from XRUN");
    logger.log_event("UNDERRUN", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "DEVICE");
    EXPECT_STREQ(entry1->message, "ALSA recovered from XRUN");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "UNDERRUN");
    EXPECT_EQ(entry2->value, 42.0f);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongStringsAreTruncated) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    const std::string long_tag(100, 't');
    const std::string long_msg(300, 'm');
    logger.log_message(long_tag.c_str(), long_msg.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::strlen(entry->tag), sizeof(entry->tag) - 1);
    EXPECT_EQ(std::strlen(entry->message), sizeof(entry->message) - 1);
}

TEST(LoggerTest, DrainWritesOneLinePerEntry) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    logger.log_event("UNDERRUN", 128.0f);
    logger.log_message("STREAM", "started");

    std::ostringstream out;
    EXPECT_EQ(logger.drain_to(out), 2u);
    const auto text = out.str();
    EXPECT_NE(text.find("[UNDERRUN] 128"), std::string::npos);
    EXPECT_NE(text.find("[STREAM] started"), std::string::npos);
    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, FullRingDropsInsteadOfBlocking) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}
    const auto dropped_before = logger.dropped_entries();

    for (int i = 0; i < 2000; ++i) {
        logger.log_event("FLOOD", static_cast<float>(i));
    }
    EXPECT_GT(logger.dropped_entries(), dropped_before);

    size_t popped = 0;
    while (logger.pop_entry()) ++popped;
    EXPECT_EQ(popped, 1023u);
}

TEST(LoggerTest, MultipleProducersNeverCorruptEntries) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;
    std::thread consumer([&] {
        for (;;) {
            if (auto e = logger.pop_entry()) {
                captured.push_back(*e);
            } else if (!running) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&logger, p] {
            for (int i = 0; i < 500; ++i) {
                logger.log_event("PRODUCER", static_cast<float>(p));
            }
        });
    }
    for (auto& t : producers) t.join();
    running = false;
    consumer.join();
    while (auto e = logger.pop_entry()) captured.push_back(*e);

    EXPECT_FALSE(captured.empty());
    for (const auto& e : captured) {
        EXPECT_STREQ(e.tag, "PRODUCER");
        EXPECT_GE(e.value, 0.0f);
        EXPECT_LT(e.value, 4.0f);
    }
}

TEST(LoggerTest, ConcurrentConsumersShareOneOrderedStream) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}
    const auto dropped_before = logger.dropped_entries();

    constexpr int total = 20000;
    std::atomic<bool> producing{true};
    std::vector<float> seen[2];

    auto consume = [&](std::vector<float>& out) {
        for (;;) {
            if (auto e = logger.pop_entry()) {
                out.push_back(e->value);
            } else if (!producing) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    };
    std::thread first(consume, std::ref(seen[0]));
    std::thread second(consume, std::ref(seen[1]));

    for (int i = 0; i < total; ++i) {
        logger.log_event("SEQ", static_cast<float>(i));
    }
    producing = false;
    first.join();
    second.join();

    std::vector<float> all;
    for (auto& values : seen) {
        for (size_t i = 1; i < values.size(); ++i) {
            EXPECT_LT(values[i - 1], values[i]);
        }
        all.insert(all.end(), values.begin(), values.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
    EXPECT_EQ(all.size() + (logger.dropped_entries() - dropped_before), static_cast<size_t>(total));
}
