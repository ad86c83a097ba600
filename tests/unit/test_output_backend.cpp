#include <gtest/gtest.h>
#include "EngineError.hpp"
#include "Logger.hpp"
#include "OutputBackend.hpp"
#include "TestHelper.hpp"
#include <cstring>
#include <vector>

using namespace deck;

class OutputBackendTest : public ::testing::Test {
protected:
    OutputBackendTest()
        : host(hal::NullHostOptions{{"Null Output", "Null Headphones"}, false})
    {
        format.sample_rate = 48000;
        format.channels = 2;
        format.block_size = 4;
    }

    hal::NullHost host;
    hal::StreamFormat format;
};

TEST_F(OutputBackendTest, PushOpensStoppedAndOnlyStartRunsTheUnit) {
    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("default");
    auto* driver = test::null_driver(output.get());
    ASSERT_NE(driver, nullptr);
    EXPECT_FALSE(driver->is_running());

    output->enqueue({1.0f, 0.5f}, 48000, 1);
    EXPECT_FALSE(output->is_empty());
    output->play();
    EXPECT_FALSE(driver->is_running());
    output->start();
    EXPECT_TRUE(driver->is_running());

    auto block = driver->pump(4);
    EXPECT_EQ(block, (std::vector<float>{1.0f, 1.0f, 0.5f, 0.5f, 0.0f, 0.0f, 0.0f, 0.0f}));
    EXPECT_TRUE(output->is_empty());
}

TEST_F(OutputBackendTest, PushPauseKeepsUnitRunningAndSamplesQueued) {
    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("1");
    auto* driver = test::null_driver(output.get());

    output->enqueue(std::vector<float>(16, 0.25f), 48000, 2);
    output->start();
    output->play();
    output->pause();
    EXPECT_TRUE(output->is_paused());

    auto block = driver->pump(4);
    for (float s : block) EXPECT_EQ(s, 0.0f);
    EXPECT_TRUE(driver->is_running());
    EXPECT_FALSE(output->is_empty());

    output->start();
    output->play();
    block = driver->pump(4);
    EXPECT_EQ(block[0], 0.25f);
}

TEST_F(OutputBackendTest, StopClearsAndPausesResetClearsAndUnpauses) {
    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("default");
    output->enqueue(std::vector<float>(8, 1.0f), 48000, 2);
    output->start();
    output->play();

    output->stop();
    EXPECT_TRUE(output->is_empty());
    EXPECT_TRUE(output->is_paused());

    output->enqueue(std::vector<float>(8, 1.0f), 48000, 2);
    output->reset();
    EXPECT_TRUE(output->is_empty());
    EXPECT_FALSE(output->is_paused());
}

TEST_F(OutputBackendTest, CloseReleasesEverythingAndIsIdempotent) {
    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("default");
    output->enqueue(std::vector<float>(8, 1.0f), 48000, 2);
    output->start();
    output->play();

    output->close();
    EXPECT_EQ(test::null_driver(output.get()), nullptr);
    EXPECT_TRUE(output->is_empty());
    EXPECT_FALSE(output->is_paused());
    output->close();
}

TEST_F(OutputBackendTest, PushUnderrunIsLogged) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("default");
    auto* driver = test::null_driver(output.get());
    output->enqueue(std::vector<float>(2, 1.0f), 48000, 2);
    output->start();
    output->play();
    driver->pump(4);

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_STREQ(entry->tag, "UNDERRUN");
    EXPECT_EQ(entry->value, 6.0f);
}

TEST_F(OutputBackendTest, PullStreamRunsFromOpen) {
    OutputBackend backend(host, OutputModel::Pull, format);
    auto output = backend.open("0");
    auto* driver = test::null_driver(output.get());
    ASSERT_NE(driver, nullptr);
    EXPECT_TRUE(driver->is_running());
    EXPECT_TRUE(output->is_empty());

    output->enqueue({0.1f, 0.2f, 0.3f, 0.4f}, 48000, 2);
    auto block = driver->pump(4);
    EXPECT_EQ(block[0], 0.1f);
    EXPECT_EQ(block[3], 0.4f);
    EXPECT_EQ(block[4], 0.0f);
    EXPECT_TRUE(output->is_empty());
}

TEST_F(OutputBackendTest, PullPauseResumesWithoutLoss) {
    OutputBackend backend(host, OutputModel::Pull, format);
    auto output = backend.open("default");
    auto* driver = test::null_driver(output.get());

    std::vector<float> clip(16);
    for (size_t i = 0; i < clip.size(); ++i) clip[i] = static_cast<float>(i + 1);
    output->enqueue(clip, 48000, 2);

    auto first = driver->pump(2);
    output->pause();
    auto muted = driver->pump(2);
    for (float s : muted) EXPECT_EQ(s, 0.0f);

    output->start();
    output->play();
    auto resumed = driver->pump(2);
    EXPECT_EQ(first[3], 4.0f);
    EXPECT_EQ(resumed[0], 5.0f);
}

TEST_F(OutputBackendTest, EnqueueConvertsToDeviceFormat) {
    OutputBackend backend(host, OutputModel::Push, format);
    auto output = backend.open("default");
    // 24 kHz mono, 4 frames -> 48 kHz stereo, 8 frames
    output->enqueue({0.0f, 0.0f, 0.0f, 0.0f}, 24000, 1);
    auto* ring = dynamic_cast<PushRingOutput*>(output.get());
    ASSERT_NE(ring, nullptr);
    EXPECT_EQ(ring->buffer()->size(), 16u);
}

TEST_F(OutputBackendTest, UnknownDeviceFailsWithoutOpening) {
    OutputBackend backend(host, OutputModel::Push, format);
    try {
        backend.open("7");
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DeviceError);
    }
    EXPECT_EQ(host.drivers_opened(), 0u);
}
