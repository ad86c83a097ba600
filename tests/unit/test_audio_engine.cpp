#include <gtest/gtest.h>
#include "AudioEngine.hpp"
#include "EngineError.hpp"
#include "TestHelper.hpp"
#include <limits>

using namespace deck;

namespace {

template<typename Fn>
ErrorKind error_of(Fn&& fn) {
    try {
        fn();
    } catch (const EngineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected EngineError";
    return ErrorKind::Disconnected;
}

} // namespace

class AudioEngineTest : public ::testing::TestWithParam<OutputModel> {
protected:
    void SetUp() override {
        fixture = test::make_engine(GetParam(), {"Null Output", "Null Headphones"}, 1);
        engine = fixture.engine.get();
    }

    test::EngineFixture fixture;
    AudioEngine* engine = nullptr;
};

TEST_P(AudioEngineTest, NewPlayerIsIdle) {
    const auto h = engine->create_player();
    EXPECT_NE(h, 0u);
    auto s = engine->get_state(h);
    EXPECT_EQ(s.handle, h);
    EXPECT_EQ(s.device_id, "default");
    EXPECT_FALSE(s.has_audio);
    EXPECT_FALSE(s.is_playing);
    EXPECT_FALSE(s.is_paused);
    EXPECT_TRUE(s.is_empty);
}

TEST_P(AudioEngineTest, HandlesAreDistinctAndIncreasing) {
    const auto a = engine->create_player();
    const auto b = engine->create_player();
    EXPECT_LT(a, b);
    EXPECT_EQ(engine->player_count(), 2u);
}

TEST_P(AudioEngineTest, DestroySucceedsExactlyOnce) {
    EXPECT_EQ(error_of([&] { engine->destroy_player(42); }), ErrorKind::NotFound);

    const auto h = engine->create_player();
    EXPECT_NO_THROW(engine->destroy_player(h));
    EXPECT_EQ(error_of([&] { engine->destroy_player(h); }), ErrorKind::NotFound);
    EXPECT_EQ(engine->player_count(), 0u);
}

TEST_P(AudioEngineTest, ToggleWithoutAssetIsInvalid) {
    const auto h = engine->create_player();
    EXPECT_EQ(error_of([&] { engine->toggle_playback(h); }), ErrorKind::InvalidArgument);
    EXPECT_FALSE(engine->get_state(h).is_playing);
}

TEST_P(AudioEngineTest, DestroyReleasesHardware) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    engine->toggle_playback(h);
    auto* driver = test::null_driver(engine->find_player(h)->output());
    ASSERT_NE(driver, nullptr);
    EXPECT_TRUE(driver->is_running());

    engine->destroy_player(h);
    EXPECT_EQ(engine->find_player(h), nullptr);
    EXPECT_EQ(error_of([&] { engine->destroy_player(h); }), ErrorKind::NotFound);
    EXPECT_EQ(error_of([&] { engine->get_state(h); }), ErrorKind::NotFound);
}

TEST_P(AudioEngineTest, LoadAssetReportsNameAndSurvivesToggle) {
    const auto h = engine->create_player();
    auto s = engine->load_asset(h, test::fake_asset(), "x.mp3");
    EXPECT_TRUE(s.has_audio);
    EXPECT_EQ(s.asset_name, "x.mp3");

    s = engine->toggle_playback(h);
    EXPECT_TRUE(s.has_audio);
    EXPECT_EQ(s.asset_name, "x.mp3");
}

TEST_P(AudioEngineTest, ToggleCyclesWithoutRedecoding) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");

    auto s = engine->toggle_playback(h);
    EXPECT_TRUE(s.is_playing);
    EXPECT_FALSE(s.is_paused);

    s = engine->toggle_playback(h);
    EXPECT_FALSE(s.is_playing);
    EXPECT_TRUE(s.is_paused);

    // The decoder throws on any second decode
    s = engine->toggle_playback(h);
    EXPECT_TRUE(s.is_playing);
    EXPECT_EQ(fixture.decode_calls->load(), 1);
}

TEST_P(AudioEngineTest, StopIsIdempotent) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    engine->toggle_playback(h);

    const auto first = engine->stop(h);
    const auto second = engine->stop(h);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(first.is_playing);
    EXPECT_TRUE(first.is_empty);
    EXPECT_EQ(fixture.host->drivers_opened(), 1u);
}

TEST_P(AudioEngineTest, RawPcmRejectsZeroFormatAndKeepsState) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    const auto before = engine->get_state(h);

    EXPECT_EQ(error_of([&] { engine->play_raw_pcm(h, 0, 1, {0.1f}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(error_of([&] { engine->play_raw_pcm(h, 48000, 0, {0.1f}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(engine->get_state(h), before);
    EXPECT_EQ(fixture.host->drivers_opened(), 0u);
}

TEST_P(AudioEngineTest, RawPcmPlaysImmediatelyAndBypassesDecoder) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    engine->toggle_playback(h);
    engine->toggle_playback(h); // paused

    auto s = engine->play_raw_pcm(h, 24000, 1, std::vector<float>(2400, 0.3f));
    EXPECT_TRUE(s.is_playing);
    EXPECT_FALSE(s.is_paused);
    EXPECT_EQ(fixture.decode_calls->load(), 1);
}

TEST_P(AudioEngineTest, RawPcmWithoutAssetPlays) {
    const auto h = engine->create_player();
    auto s = engine->play_raw_pcm(h, 16000, 1, std::vector<float>(160, 0.5f));
    EXPECT_FALSE(s.has_audio);
    EXPECT_TRUE(s.is_playing);
}

TEST_P(AudioEngineTest, DrainedOutputReportsNotPlaying) {
    const auto h = engine->create_player();
    engine->play_raw_pcm(h, 48000, 2, std::vector<float>(8, 0.5f));
    auto* driver = test::null_driver(engine->find_player(h)->output());
    ASSERT_NE(driver, nullptr);
    driver->pump(16);

    auto s = engine->get_state(h);
    EXPECT_TRUE(s.is_empty);
    EXPECT_FALSE(s.is_paused);
    EXPECT_FALSE(s.is_playing);
}

TEST_P(AudioEngineTest, SetDeviceReopensEagerly) {
    const auto h = engine->create_player();
    auto s = engine->set_player_device(h, "1");
    EXPECT_EQ(s.device_id, "1");
    EXPECT_EQ(fixture.host->drivers_opened(), 1u);
    EXPECT_NE(engine->find_player(h)->output(), nullptr);
}

TEST_P(AudioEngineTest, SetDeviceResetsTransportAndRedecodes) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    engine->toggle_playback(h);

    auto s = engine->set_player_device(h, "1");
    EXPECT_TRUE(s.is_empty);
    EXPECT_FALSE(s.is_playing);
    EXPECT_TRUE(s.has_audio);

    // Next toggle must decode again; this decoder allows only one
    EXPECT_EQ(error_of([&] { engine->toggle_playback(h); }), ErrorKind::DecodeError);
    EXPECT_EQ(fixture.decode_calls->load(), 2);
}

TEST_P(AudioEngineTest, SetDeviceFailureKeepsIdentifier) {
    const auto h = engine->create_player();
    engine->set_player_device(h, "1");
    EXPECT_EQ(error_of([&] { engine->set_player_device(h, "nope"); }), ErrorKind::DeviceError);
    EXPECT_EQ(engine->get_state(h).device_id, "1");
    EXPECT_EQ(error_of([&] { engine->set_player_device(999, "0"); }), ErrorKind::NotFound);
}

TEST_P(AudioEngineTest, ListDevicesStartsWithDefault) {
    auto devices = engine->list_devices();
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].id, "default");
    EXPECT_EQ(devices[2].name, "Null Headphones");
}

TEST_P(AudioEngineTest, DispatchFulfillsReplyWithValueOrError) {
    command::CreatePlayer create;
    auto created = create.reply.get_future();
    Command c1 = std::move(create);
    engine->dispatch(c1);
    const auto h = created.get();

    command::GetState missing{h + 100, {}};
    auto failed = missing.reply.get_future();
    Command c2 = std::move(missing);
    engine->dispatch(c2);
    try {
        failed.get();
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_P(AudioEngineTest, RunServesQueuedCommandsThenTearsDown) {
    CommandQueue queue;
    command::CreatePlayer create;
    auto created = create.reply.get_future();
    queue.push(std::move(create));
    queue.close();

    engine->run(queue);
    EXPECT_NE(created.get(), 0u);
    EXPECT_EQ(engine->player_count(), 0u);
}

TEST_P(AudioEngineTest, NoDefaultDeviceSurfacesDeviceError) {
    auto empty = test::make_engine(GetParam(), {});
    const auto h = empty.engine->create_player();
    empty.engine->load_asset(h, test::fake_asset(), "x.mp3");
    EXPECT_EQ(error_of([&] { empty.engine->toggle_playback(h); }), ErrorKind::DeviceError);
    EXPECT_EQ(error_of([&] { empty.engine->stop(h); }), ErrorKind::DeviceError);
    EXPECT_TRUE(empty.engine->get_state(h).has_audio);
}

class UnitStartFailureTest : public ::testing::TestWithParam<OutputModel> {
protected:
    void SetUp() override {
        fixture = test::make_engine_on(std::make_unique<test::RefusingHost>(), GetParam());
        engine = fixture.engine.get();
    }

    test::EngineFixture fixture;
    AudioEngine* engine = nullptr;
};

TEST_P(UnitStartFailureTest, ToggleLeavesPlayerStopped) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    const auto before = engine->get_state(h);

    EXPECT_EQ(error_of([&] { engine->toggle_playback(h); }), ErrorKind::DeviceError);
    const auto after = engine->get_state(h);
    EXPECT_FALSE(after.is_playing);
    EXPECT_TRUE(after.is_empty);
    EXPECT_EQ(after, before);
}

TEST_P(UnitStartFailureTest, RawPcmLeavesPlayerStopped) {
    const auto h = engine->create_player();
    const auto before = engine->get_state(h);

    EXPECT_EQ(error_of([&] { engine->play_raw_pcm(h, 48000, 2, std::vector<float>(64, 0.5f)); }),
              ErrorKind::DeviceError);
    const auto after = engine->get_state(h);
    EXPECT_FALSE(after.is_playing);
    EXPECT_TRUE(after.is_empty);
    EXPECT_EQ(after, before);
}

TEST_P(UnitStartFailureTest, StoppedPlayerDoesNotResumeOnFailedStart) {
    const auto h = engine->create_player();
    engine->load_asset(h, test::fake_asset(), "x.mp3");
    EXPECT_THROW(engine->toggle_playback(h), EngineError);
    EXPECT_THROW(engine->toggle_playback(h), EngineError);
    EXPECT_FALSE(engine->get_state(h).is_playing);
}

INSTANTIATE_TEST_SUITE_P(BothModels, UnitStartFailureTest,
                         ::testing::Values(OutputModel::Pull, OutputModel::Push),
                         [](const ::testing::TestParamInfo<OutputModel>& info) {
                             return std::string(to_string(info.param));
                         });

INSTANTIATE_TEST_SUITE_P(BothModels, AudioEngineTest,
                         ::testing::Values(OutputModel::Pull, OutputModel::Push),
                         [](const ::testing::TestParamInfo<OutputModel>& info) {
                             return std::string(to_string(info.param));
                         });

TEST(HandleIssuerTest, WrapsToOneAndSkipsLiveHandles) {
    const PlayerHandle max = std::numeric_limits<PlayerHandle>::max();
    HandleIssuer issuer(max - 1);
    auto none = [](PlayerHandle) { return false; };
    EXPECT_EQ(issuer.issue(none), max - 1);
    EXPECT_EQ(issuer.issue(none), max);
    EXPECT_EQ(issuer.issue([](PlayerHandle h) { return h == 1 || h == 2; }), 3u);
}

TEST(HandleIssuerTest, NeverIssuesZero) {
    HandleIssuer issuer(0);
    EXPECT_EQ(issuer.issue([](PlayerHandle) { return false; }), 1u);
}
