#include <gtest/gtest.h>
#include "core/playback_engine.hpp"
#include "core/sync_controller.hpp"
#include "core/transcription_engine.hpp"
#include "test_support.hpp"

using namespace voxplay::core;
using namespace voxplay::modules;
using namespace voxplay::tests;

namespace {

Transcript hello_world() {
    return {{"hello", 0.0, 1.2}, {"world", 1.5, 2.0}};
}

} // namespace

TEST(FindSegmentTest, ContainingIntervalOrGap) {
    Transcript segments = hello_world();
    auto at = [&](double p) { return SyncController::find_segment(segments, p); };

    ASSERT_TRUE(at(0.8).has_value());
    EXPECT_EQ(segments[*at(0.8)].text, "hello");
    EXPECT_FALSE(at(1.3).has_value());
    ASSERT_TRUE(at(1.7).has_value());
    EXPECT_EQ(segments[*at(1.7)].text, "world");
}

TEST(FindSegmentTest, IntervalBoundaries) {
    Transcript segments = hello_world();
    EXPECT_EQ(SyncController::find_segment(segments, 0.0), std::optional<size_t>(0));
    EXPECT_FALSE(SyncController::find_segment(segments, 1.2).has_value()); // end is exclusive
    EXPECT_EQ(SyncController::find_segment(segments, 1.5), std::optional<size_t>(1));
    EXPECT_FALSE(SyncController::find_segment(segments, 2.0).has_value());
    EXPECT_FALSE(SyncController::find_segment(segments, -0.5).has_value());
    EXPECT_FALSE(SyncController::find_segment(Transcript{}, 1.0).has_value());
}

TEST(FindSegmentTest, EveryHitContainsPosition) {
    Transcript segments;
    for (int i = 0; i < 200; ++i) {
        segments.push_back({"w" + std::to_string(i), i * 0.5, i * 0.5 + 0.3});
    }
    for (double p = -0.1; p < 101.0; p += 0.07) {
        auto index = SyncController::find_segment(segments, p);
        if (index) {
            EXPECT_LE(segments[*index].start, p);
            EXPECT_LT(p, segments[*index].end);
        } else {
            for (const auto& seg : segments) {
                EXPECT_FALSE(p >= seg.start && p < seg.end) << p;
            }
        }
    }
}

class SyncControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_ = std::make_shared<FakeDevice>();
        script_ = std::make_shared<RecognizerScript>();
        script_->segments = {{"hello", 0.0, 1.2}, {"world", 1.5, 2.0}};

        playback_ = std::make_unique<PlaybackEngine>(fake_output_factory(device_), AudioOutputConfig{},
                                                     PlaybackConfig{});
        transcription_ = std::make_unique<TranscriptionEngine>(std::make_unique<FakeRecognizer>(script_),
                                                               TranscriptionConfig{});
        sync_ = std::make_unique<SyncController>(*playback_, *transcription_);

        auto source = std::make_shared<const Source>(Source::from_bytes(make_wav(16000, 1, 2.5)));
        ASSERT_TRUE(playback_->load(source).has_value());
        ASSERT_TRUE(playback_->decoded_audio()->wait_complete(std::chrono::milliseconds(2000)));
    }

    void TearDown() override {
        script_->hold = false;
        sync_.reset();
        transcription_.reset();
        playback_.reset();
    }

    void transcribe_and_wait() {
        ASSERT_TRUE(transcription_->transcribe(playback_->decoded_audio(), AudioFormat::Wav).has_value());
        ASSERT_EQ(transcription_->wait(std::chrono::milliseconds(3000)), TranscriptionState::Complete);
        ASSERT_TRUE(wait_until([&] { return sync_->segments() != nullptr; }));
    }

    std::shared_ptr<FakeDevice> device_;
    std::shared_ptr<RecognizerScript> script_;
    std::unique_ptr<PlaybackEngine> playback_;
    std::unique_ptr<TranscriptionEngine> transcription_;
    std::unique_ptr<SyncController> sync_;
};

TEST_F(SyncControllerTest, NoLookupsUntilComplete) {
    EXPECT_FALSE(sync_->active_segment(0.8).has_value());
    EXPECT_EQ(sync_->segments(), nullptr);

    script_->hold = true;
    ASSERT_TRUE(transcription_->transcribe(playback_->decoded_audio(), AudioFormat::Wav).has_value());
    EXPECT_EQ(transcription_->state(), TranscriptionState::Running);
    EXPECT_FALSE(sync_->active_segment(0.8).has_value());
    EXPECT_FALSE(sync_->active_index(0.8).has_value());
}

TEST_F(SyncControllerTest, ActivationIsNoopUntilComplete) {
    playback_->seek(0.7);
    EXPECT_FALSE(sync_->activate_index(1));
    EXPECT_FALSE(sync_->on_segment_activated(TranscriptSegment{"world", 1.5, 2.0}));
    EXPECT_NEAR(playback_->position(), 0.7, 1e-9);
}

TEST_F(SyncControllerTest, ActiveSegmentAfterCompletion) {
    transcribe_and_wait();
    ASSERT_TRUE(sync_->active_segment(0.8).has_value());
    EXPECT_EQ(sync_->active_segment(0.8)->text, "hello");
    EXPECT_FALSE(sync_->active_segment(1.3).has_value());
    EXPECT_EQ(sync_->active_segment(1.7)->text, "world");
    ASSERT_NE(sync_->segments(), nullptr);
    EXPECT_EQ(sync_->segments()->size(), 2u);
}

TEST_F(SyncControllerTest, ActivatingSegmentSeeksToItsStart) {
    transcribe_and_wait();
    ASSERT_TRUE(sync_->activate_index(1));
    EXPECT_DOUBLE_EQ(playback_->position(), 1.5);
    EXPECT_EQ(sync_->current_index(), std::optional<size_t>(1));

    ASSERT_TRUE(sync_->on_segment_activated((*sync_->segments())[0]));
    EXPECT_DOUBLE_EQ(playback_->position(), 0.0);
    EXPECT_EQ(sync_->current_segment()->text, "hello");

    EXPECT_FALSE(sync_->activate_index(7));
}

TEST_F(SyncControllerTest, ActivationPreservesPlaybackState) {
    transcribe_and_wait();
    ASSERT_TRUE(playback_->play().has_value());
    ASSERT_TRUE(sync_->activate_index(1));
    EXPECT_EQ(playback_->state(), PlaybackState::Playing);
    EXPECT_NEAR(playback_->position(), 1.5, 1e-9);

    playback_->pause();
    ASSERT_TRUE(sync_->activate_index(0));
    EXPECT_EQ(playback_->state(), PlaybackState::Paused);
    EXPECT_DOUBLE_EQ(playback_->position(), 0.0);
}

TEST_F(SyncControllerTest, CompletionMidPlaybackRefreshesImmediately) {
    ASSERT_TRUE(playback_->play().has_value());
    playback_->seek(1.7);
    sync_->refresh();
    EXPECT_FALSE(sync_->current_index().has_value());

    ASSERT_TRUE(transcription_->transcribe(playback_->decoded_audio(), AudioFormat::Wav).has_value());

    // No refresh() from the host: the completion itself recomputes.
    ASSERT_TRUE(wait_until([&] { return sync_->current_index().has_value(); }));
    EXPECT_EQ(*sync_->current_index(), 1u);
    EXPECT_EQ(sync_->current_segment()->text, "world");
}

TEST_F(SyncControllerTest, ActivationRefusedWhenPlaybackCannotSeek) {
    transcribe_and_wait();
    playback_->stop();
    EXPECT_FALSE(sync_->activate_index(1));
    EXPECT_FALSE(sync_->on_segment_activated((*sync_->segments())[1]));
    EXPECT_EQ(playback_->state(), PlaybackState::Stopped);
    EXPECT_DOUBLE_EQ(playback_->position(), 0.0);
}

TEST_F(SyncControllerTest, RefreshTracksPlaybackPosition) {
    transcribe_and_wait();
    ASSERT_TRUE(playback_->play().has_value());
    sync_->refresh();
    EXPECT_EQ(sync_->current_index(), std::optional<size_t>(0));

    playback_->seek(1.3);
    sync_->refresh();
    EXPECT_FALSE(sync_->current_index().has_value());
    EXPECT_FALSE(sync_->current_segment().has_value());
}

TEST_F(SyncControllerTest, FailedTranscriptionClearsActiveSegment) {
    script_->recognize_error = RecognizerError::InferenceFailed;
    ASSERT_TRUE(transcription_->transcribe(playback_->decoded_audio(), AudioFormat::Wav).has_value());
    ASSERT_EQ(transcription_->wait(std::chrono::milliseconds(3000)), TranscriptionState::Failed);
    sync_->refresh();
    EXPECT_FALSE(sync_->current_index().has_value());
    EXPECT_EQ(sync_->segments(), nullptr);
}

TEST_F(SyncControllerTest, ResetAfterCancelDropsSegments) {
    transcribe_and_wait();
    transcription_->cancel();
    sync_->reset();
    EXPECT_EQ(sync_->segments(), nullptr);
    EXPECT_FALSE(sync_->current_index().has_value());
    EXPECT_FALSE(sync_->activate_index(0));
}
