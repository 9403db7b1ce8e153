#include "errors.hpp"
#include "listen_session.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {

SessionConfig fast_config(unsigned listen_ms) {
    SessionConfig cfg;
    cfg.listen_duration_ms = listen_ms;
    cfg.passive_window_ms = 1000;
    cfg.active_window_ms = 3000;
    cfg.guard_samples = 0;
    cfg.active_timeout_ms = 5000;
    cfg.active_windows = 1;
    cfg.channel_capacity = 256;
    cfg.poll_interval_ms = 5;
    return cfg;
}

// 0.1 s frames at 16 kHz.
std::vector<AudioFrame> frames(std::size_t count, bool marker) {
    std::vector<AudioFrame> out;
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(mono_frame(marker ? marked(1600) : silence(1600)));
    }
    return out;
}

void append(std::vector<AudioFrame>& to, std::vector<AudioFrame> more) {
    for (auto& f : more) to.push_back(std::move(f));
}

} // namespace

TEST(ListenSession, TranscribesAfterWakeWord) {
    std::vector<AudioFrame> script = frames(10, false);
    append(script, frames(10, true));
    append(script, frames(30, false));

    auto log = std::make_shared<ModelLog>();
    auto source = std::make_unique<ScriptedSource>(std::move(script));
    ScriptedSource* raw = source.get();
    RecordingNotifier notifier;

    ListenSession session(std::move(source), marker_model(log), {"hey"}, fast_config(300), &notifier);
    EXPECT_EQ(session.run(), "hey there");

    EXPECT_TRUE(raw->started());
    EXPECT_TRUE(raw->stopped());
    EXPECT_EQ(notifier.posts(), std::vector<std::string>{"hey there"});
    EXPECT_EQ(session.state(), ListenState::Stopped);
    EXPECT_EQ(session.orchestrator().windows_processed(), 3u);
    EXPECT_EQ(session.dropped_frames(), 0u);

    const std::vector<std::size_t> sizes{16000, 16000, 16000, 48000};
    EXPECT_EQ(log->window_sizes, sizes);
    EXPECT_NE(session.release_model(), nullptr);
}

TEST(ListenSession, NormalizesStereo48kInput) {
    std::vector<AudioFrame> script;
    for (int i = 0; i < 20; ++i) {
        AudioFrame frame;
        frame.channels = 2;
        frame.sample_rate = 48000;
        frame.samples.assign(4800, 0.0f);
        script.push_back(std::move(frame));
    }

    auto log = std::make_shared<ModelLog>();
    ListenSession session(std::make_unique<ScriptedSource>(std::move(script)), marker_model(log), {"hey"},
                          fast_config(200));
    EXPECT_EQ(session.run(), "");
    ASSERT_EQ(log->window_sizes.size(), 1u);
    EXPECT_EQ(log->window_sizes[0], 16000u);
    EXPECT_EQ(session.dropped_tail_samples(), 0u);
}

TEST(ListenSession, StopEndsUnboundedSession) {
    ListenSession session(std::make_unique<ScriptedSource>(frames(3, false)), marker_model(), {"hey"},
                          fast_config(0));
    std::thread stopper([&] {
        std::this_thread::sleep_for(50ms);
        session.stop();
    });
    EXPECT_EQ(session.run(), "");
    stopper.join();
    EXPECT_EQ(session.state(), ListenState::Stopped);
}

TEST(ListenSession, StreamFailureSurfacesAsDeviceError) {
    auto source = std::make_unique<ScriptedSource>(frames(10, false));
    source->fail_with(DeviceErrorKind::StreamFailed, "device unplugged");

    ListenSession session(std::move(source), marker_model(), {"hey"}, fast_config(0));
    try {
        session.run();
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceErrorKind::StreamFailed);
        EXPECT_STREQ(e.what(), "device unplugged");
    }
    EXPECT_EQ(session.state(), ListenState::Stopped);
    EXPECT_EQ(session.orchestrator().windows_processed(), 1u);
    EXPECT_NE(session.release_model(), nullptr);
}

TEST(ListenSession, DeviceThatWontStart) {
    auto source = std::make_unique<ScriptedSource>(std::vector<AudioFrame>{});
    source->refuse_start(DeviceErrorKind::Unavailable, "no capture device");

    ListenSession session(std::move(source), marker_model(), {"hey"}, fast_config(0));
    EXPECT_THROW(session.run(), DeviceError);
    EXPECT_EQ(session.state(), ListenState::Stopped);
    EXPECT_NE(session.release_model(), nullptr);
}

TEST(ListenSession, FatalInferenceDiscardsModel) {
    auto model = std::make_unique<StubModel>(
        [](const std::vector<float>&, DecodeStrategy) -> std::vector<std::string> {
            throw InferenceError("model state corrupted", true);
        });
    ListenSession session(std::make_unique<ScriptedSource>(frames(10, false)), std::move(model), {"hey"},
                          fast_config(0));
    EXPECT_THROW(session.run(), InferenceError);
    EXPECT_EQ(session.release_model(), nullptr);
}

TEST(ListenSession, RequiresSource) {
    EXPECT_THROW({ ListenSession session(nullptr, marker_model(), {"hey"}, fast_config(0)); }, DeviceError);
}
