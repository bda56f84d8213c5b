#include <gtest/gtest.h>
#include "core/playback_engine.hpp"
#include "test_support.hpp"
#include <chrono>
#include <thread>

using namespace voxplay::core;
using namespace voxplay::modules;
using namespace voxplay::tests;

class PlaybackEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_ = std::make_shared<FakeDevice>();
        engine_ = std::make_unique<PlaybackEngine>(fake_output_factory(device_), AudioOutputConfig{}, PlaybackConfig{});
    }

    void TearDown() override {
        engine_.reset();
    }

    void load_tone(double seconds, int rate = 8000, int channels = 1) {
        auto source = std::make_shared<const Source>(Source::from_bytes(make_wav(rate, channels, seconds)));
        ASSERT_TRUE(engine_->load(source).has_value());
        ASSERT_TRUE(engine_->decoded_audio()->wait_complete(std::chrono::milliseconds(2000)));
    }

    // Pulls small blocks until the reported position leaves `from`. After a
    // seek the first pulls only drop stale audio while the feeder refills.
    bool pull_until_advanced(double from, size_t block = 80) {
        return wait_until([&] {
            device_->pull(block);
            return engine_->position() > from;
        });
    }

    std::shared_ptr<FakeDevice> device_;
    std::unique_ptr<PlaybackEngine> engine_;
};

TEST_F(PlaybackEngineTest, StartsIdle) {
    EXPECT_EQ(engine_->state(), PlaybackState::Idle);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
    EXPECT_DOUBLE_EQ(engine_->duration(), 0.0);
    EXPECT_EQ(engine_->decoded_audio(), nullptr);
}

TEST_F(PlaybackEngineTest, LoadReachesReady) {
    load_tone(2.0);
    EXPECT_EQ(engine_->state(), PlaybackState::Ready);
    EXPECT_NEAR(engine_->duration(), 2.0, 1e-6);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
    ASSERT_TRUE(engine_->source_format().has_value());
    EXPECT_EQ(*engine_->source_format(), AudioFormat::Wav);
    EXPECT_FALSE(engine_->last_error().has_value());
    // The device is only acquired by play().
    EXPECT_EQ(device_->opens.load(), 0);
}

TEST_F(PlaybackEngineTest, LoadMissingFileErrors) {
    auto res = engine_->load(std::make_shared<const Source>(Source::from_path("/tmp/voxplay_missing.mp3")));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), MediaError::FileNotFound);
    EXPECT_EQ(engine_->state(), PlaybackState::Errored);
    ASSERT_TRUE(engine_->last_error().has_value());
    EXPECT_EQ(*engine_->last_error(), MediaError::FileNotFound);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
}

TEST_F(PlaybackEngineTest, LoadUnsupportedErrors) {
    auto res = engine_->load(std::make_shared<const Source>(Source::from_bytes({'n', 'o', 'p', 'e', 0, 0, 0, 0})));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), MediaError::UnsupportedFormat);
    EXPECT_EQ(engine_->state(), PlaybackState::Errored);
}

TEST_F(PlaybackEngineTest, EmptyStreamIsDecodeError) {
    auto res = engine_->load(std::make_shared<const Source>(Source::from_bytes(make_wav(8000, 1, 0.0))));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(engine_->state(), PlaybackState::Errored);
}

TEST_F(PlaybackEngineTest, PlayFromIdleIsInvalidState) {
    auto res = engine_->play();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), MediaError::InvalidState);
    EXPECT_EQ(engine_->state(), PlaybackState::Idle);
}

TEST_F(PlaybackEngineTest, PlayAdvancesPositionMonotonically) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_EQ(engine_->state(), PlaybackState::Playing);
    EXPECT_EQ(device_->opens.load(), 1);
    EXPECT_TRUE(device_->is_running());

    // Playing twice is a no-op.
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_EQ(device_->opens.load(), 1);

    double last = engine_->position();
    EXPECT_DOUBLE_EQ(last, 0.0);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(device_->pull(160));
        double now = engine_->position();
        EXPECT_GE(now, last);
        last = now;
    }
    EXPECT_NEAR(last, 0.2, 1e-6);
}

TEST_F(PlaybackEngineTest, DeviceQueueDelaysReportedPosition) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));
    device_->queued = 400; // half of it still in the device
    EXPECT_NEAR(engine_->position(), 0.05, 1e-6);
    device_->queued = 0;
    EXPECT_NEAR(engine_->position(), 0.1, 1e-6);
}

TEST_F(PlaybackEngineTest, PositionConstantWhilePaused) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(1600));
    engine_->pause();
    EXPECT_EQ(engine_->state(), PlaybackState::Paused);
    EXPECT_NEAR(engine_->position(), 0.2, 1e-6);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(device_->pull(800)); // device halted
    EXPECT_NEAR(engine_->position(), 0.2, 1e-6);

    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));
    EXPECT_NEAR(engine_->position(), 0.3, 1e-6);
}

TEST_F(PlaybackEngineTest, SeekClampsToDuration) {
    load_tone(2.0);
    engine_->seek(-5.0);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
    engine_->seek(100.0);
    EXPECT_NEAR(engine_->position(), 2.0, 1e-6);
    engine_->seek(1.25);
    EXPECT_NEAR(engine_->position(), 1.25, 1e-6);
    EXPECT_EQ(engine_->state(), PlaybackState::Ready);
}

TEST_F(PlaybackEngineTest, SeekWhilePausedKeepsPaused) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));
    engine_->pause();
    engine_->seek(0.5);
    EXPECT_EQ(engine_->state(), PlaybackState::Paused);
    EXPECT_NEAR(engine_->position(), 0.5, 1e-6);
    // Seeking backwards is honoured.
    engine_->seek(0.25);
    EXPECT_NEAR(engine_->position(), 0.25, 1e-6);
}

TEST_F(PlaybackEngineTest, SeekWhilePlayingResumesFromTarget) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));

    engine_->seek(1.25);
    EXPECT_EQ(engine_->state(), PlaybackState::Playing);
    EXPECT_NEAR(engine_->position(), 1.25, 1e-6);
    EXPECT_GE(device_->flushes.load(), 1);

    ASSERT_TRUE(pull_until_advanced(1.25));
    // Within one output block of the target.
    EXPECT_LE(engine_->position(), 1.25 + 80.0 / 8000 + 1e-6);
}

TEST_F(PlaybackEngineTest, LatestSeekWins) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    for (double t : {1.8, 0.3, 1.1, 0.6}) {
        engine_->seek(t);
    }
    EXPECT_NEAR(engine_->position(), 0.6, 1e-6);
    ASSERT_TRUE(pull_until_advanced(0.6));
    EXPECT_LE(engine_->position(), 0.6 + 80.0 / 8000 + 1e-6);
}

TEST_F(PlaybackEngineTest, StopReleasesOutputAndResetsPosition) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));
    engine_->stop();
    EXPECT_EQ(engine_->state(), PlaybackState::Stopped);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
    EXPECT_EQ(device_->closes.load(), 1);
    EXPECT_FALSE(device_->is_running());

    // Stopped -> Playing reacquires the device from the start.
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_EQ(device_->opens.load(), 2);
    ASSERT_TRUE(device_->pull(400));
    EXPECT_NEAR(engine_->position(), 0.05, 1e-6);
}

TEST_F(PlaybackEngineTest, StopFromIdle) {
    engine_->stop();
    EXPECT_EQ(engine_->state(), PlaybackState::Stopped);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
}

TEST_F(PlaybackEngineTest, EndOfMediaPausesAtDuration) {
    load_tone(0.5);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(wait_until([&] {
        device_->pull(400);
        return engine_->state() != PlaybackState::Playing;
    }));
    EXPECT_EQ(engine_->state(), PlaybackState::Paused);
    EXPECT_TRUE(engine_->is_at_end());
    EXPECT_NEAR(engine_->position(), 0.5, 1e-6);

    // Play from the end restarts.
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_FALSE(engine_->is_at_end());
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
}

TEST_F(PlaybackEngineTest, DeviceOpenFailureErrors) {
    load_tone(1.0);
    device_->fail_open = true;
    auto res = engine_->play();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), MediaError::OutputDeviceError);
    EXPECT_EQ(engine_->state(), PlaybackState::Errored);
    ASSERT_TRUE(engine_->last_error().has_value());
    EXPECT_EQ(*engine_->last_error(), MediaError::OutputDeviceError);
}

TEST_F(PlaybackEngineTest, DeviceLostDuringPlaybackErrors) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    device_->failed = true;
    ASSERT_TRUE(wait_until([&] { return engine_->state() == PlaybackState::Errored; }));
    EXPECT_EQ(*engine_->last_error(), MediaError::OutputDeviceError);
}

TEST_F(PlaybackEngineTest, VolumeScalesAndClamps) {
    load_tone(2.0);
    engine_->set_volume(150);
    EXPECT_EQ(engine_->volume(), 100);
    engine_->set_volume(0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(400));
    for (int16_t s : device_->last_block) {
        ASSERT_EQ(s, 0);
    }

    engine_->set_volume(100);
    ASSERT_TRUE(device_->pull(400));
    bool audible = false;
    for (int16_t s : device_->last_block) audible = audible || s != 0;
    EXPECT_TRUE(audible);
}

TEST_F(PlaybackEngineTest, ConvertsToDeviceFormat) {
    device_->forced_format = PcmFormat{16000, 2};
    load_tone(2.0, 8000, 1);
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_EQ(engine_->device_format(), (PcmFormat{16000, 2}));
    ASSERT_TRUE(device_->pull(1600));
    EXPECT_NEAR(engine_->position(), 0.1, 1e-6);
}

TEST_F(PlaybackEngineTest, ReloadReplacesSession) {
    load_tone(2.0);
    ASSERT_TRUE(engine_->play().has_value());
    ASSERT_TRUE(device_->pull(800));
    auto first = engine_->decoded_audio();

    load_tone(1.0);
    EXPECT_EQ(engine_->state(), PlaybackState::Ready);
    EXPECT_NE(engine_->decoded_audio(), first);
    EXPECT_NEAR(engine_->duration(), 1.0, 1e-6);
    EXPECT_DOUBLE_EQ(engine_->position(), 0.0);
    EXPECT_FALSE(device_->is_running());
}

TEST_F(PlaybackEngineTest, UnloadReturnsToIdle) {
    load_tone(1.0);
    engine_->unload();
    EXPECT_EQ(engine_->state(), PlaybackState::Idle);
    EXPECT_EQ(engine_->decoded_audio(), nullptr);
    EXPECT_FALSE(engine_->play().has_value());
}

TEST_F(PlaybackEngineTest, UnderrunIsCountedAndPlaybackContinues) {
    load_tone(3.0);
    ASSERT_TRUE(engine_->play().has_value());
    EXPECT_EQ(engine_->underrun_count(), 0u);

    // Default ring holds 500 ms (4000 frames at 8 kHz); ask for a full second.
    ASSERT_TRUE(device_->pull(8000));
    EXPECT_GE(engine_->underrun_count(), 1u);
    EXPECT_EQ(engine_->state(), PlaybackState::Playing);

    // Silence padding is not counted as played audio.
    double after_underrun = engine_->position();
    EXPECT_LE(after_underrun, 0.5 + 1e-6);
    ASSERT_TRUE(pull_until_advanced(after_underrun));
    EXPECT_EQ(engine_->state(), PlaybackState::Playing);
    EXPECT_FALSE(engine_->last_error().has_value());
}

TEST(DecodedAudioTest, AbsurdHeaderEstimateIsIgnored) {
    // Xing frame count of 0xFFFFFFFF at 1152 samples per frame.
    const double bogus = 4294967295.0 * 1152 / 44100;
    std::unique_ptr<DecodedAudio> audio;
    ASSERT_NO_THROW(audio = std::make_unique<DecodedAudio>(PcmFormat{44100, 2}, bogus));
    EXPECT_DOUBLE_EQ(audio->duration_seconds(), 0.0);

    PcmBlock block;
    block.samples.assign(44100 * 2, 100);
    audio->append(block);
    audio->finish(std::nullopt);
    EXPECT_EQ(audio->sample_count(), 44100 * 2);
    EXPECT_DOUBLE_EQ(audio->duration_seconds(), 1.0);
}

TEST(DecodedAudioTest, LongEstimateStillReportedWhileDecoding) {
    DecodedAudio audio(PcmFormat{48000, 2}, 5.0 * 3600.0);
    EXPECT_DOUBLE_EQ(audio.duration_seconds(), 5.0 * 3600.0);
    audio.finish(std::nullopt);
    EXPECT_DOUBLE_EQ(audio.duration_seconds(), 0.0);
    EXPECT_EQ(audio.sample_count(), 0);
}
