#include "core/PlayerEngine.h"
#include "TestUtils.h"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class PlayerEngineTests : public juce::UnitTest
{
public:
    PlayerEngineTests() : juce::UnitTest("PlayerEngineTests") {}

    void runTest() override
    {
        beginTest("Load and play");
        testLoadAndPlay();

        beginTest("Commands that need audio fail without it");
        testNoAsset();

        beginTest("Failed load keeps the previous asset");
        testDecodeFailure();

        beginTest("Speed is clamped, not rejected");
        testSpeedClamp();

        beginTest("Loop region round trip");
        testLoopRoundTrip();

        beginTest("Half speed A/B loop cycles every four seconds");
        testLoopScenario();

        beginTest("The end of the loop is heard on every pass");
        testLoopTailHeard();

        beginTest("Seek never plays pre-seek audio");
        testSeekFlushes();

        beginTest("Pause, resume and stop");
        testPauseResumeStop();

        beginTest("Playback stops at the end of the file");
        testEndOfFile();

        beginTest("Device rate differs from the asset rate");
        testRateMismatch();

        beginTest("Full command queue is reported");
        testCommandQueueFull();

        beginTest("Unsupported channel layout latches a render failure");
        testRenderFailure();

        beginTest("Render thread");
        testRenderThread();
    }

private:
    static constexpr double kRate = 44100.0;
    static constexpr int kDeviceBlock = 256;

    struct Fixture
    {
        explicit Fixture(double deviceRate = kRate, double minSpeed = 0.125)
        {
            auto fake = std::make_unique<TestUtils::FakeDecoder>();
            decoder = fake.get();

            loopah::EngineSettings settings;
            settings.deviceSampleRate = deviceRate;
            settings.blockFrames = 512;
            settings.queueBlocks = 4;
            settings.speedLimits.minSpeed = minSpeed;
            engine = std::make_unique<loopah::PlayerEngine>(settings, std::move(fake));

            loopah::EngineCallbacks callbacks;
            callbacks.onMessage = [this](const std::string& msg) { messages.push_back(msg); };
            engine->setCallbacks(callbacks);
        }

        bool heard(const std::string& text) const
        {
            for (const auto& m : messages)
                if (m.find(text) != std::string::npos) return true;
            return false;
        }

        // Drive the renderer and the device callback for `frames` frames.
        // Returns the frames that came from rendered audio.
        int pump(int frames, std::vector<float>* capture = nullptr)
        {
            std::vector<float> left(kDeviceBlock), right(kDeviceBlock);
            float* outs[] = { left.data(), right.data() };
            int got = 0;
            for (int done = 0; done < frames; done += kDeviceBlock)
            {
                engine->renderCycle();
                got += engine->renderOutput(outs, 2, kDeviceBlock);
                if (capture != nullptr)
                    capture->insert(capture->end(), left.begin(), left.end());
            }
            return got;
        }

        TestUtils::FakeDecoder* decoder = nullptr;
        std::unique_ptr<loopah::PlayerEngine> engine;
        std::vector<std::string> messages;
    };

    void testLoadAndPlay()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 3.0, 2));

        expect(fx.engine->load("a.wav").ok());
        expect(fx.heard("Loaded sine.wav (2 ch, 44100 Hz, 3.0 s)"));
        expect(fx.engine->play().ok());

        std::vector<float> out;
        int got = fx.pump(static_cast<int>(kRate / 2), &out);
        expect(got > 0);

        auto st = fx.engine->status();
        expect(st.state == loopah::TransportState::Playing);
        expectEquals(st.channels, 2);
        expectEquals(st.totalFrames, static_cast<int64_t>(kRate * 3));
        expectWithinAbsoluteError(st.durationSeconds, 3.0, 1e-9);
        expectEquals(juce::String(st.sourceName), juce::String("sine.wav"));
        expect(st.positionSeconds > 0.2 && st.positionSeconds < 0.6);
        expectEquals(static_cast<int>(st.underrunCount), 0);

        const int from = static_cast<int>(out.size() / 2);
        expectGreaterThan(TestUtils::rms(out.data() + from, static_cast<int>(out.size()) - from), 0.1f);

        expect(fx.engine->togglePlay().ok());
        fx.pump(kDeviceBlock);
        expect(fx.engine->status().state == loopah::TransportState::Paused);
    }

    void testNoAsset()
    {
        Fixture fx;
        expect(fx.engine->play().error == loopah::ErrorKind::NoAsset);
        expect(fx.engine->seekSeconds(1.0).error == loopah::ErrorKind::NoAsset);
        expect(fx.engine->setLoopFrames(0, 100).error == loopah::ErrorKind::NoAsset);
        expect(fx.engine->status().lastError == loopah::ErrorKind::NoAsset);

        fx.engine->clearError();
        expect(fx.engine->status().lastError == loopah::ErrorKind::None);

        std::vector<float> out;
        expectEquals(fx.pump(1024, &out), 0);
        expectEquals(TestUtils::rms(out.data(), static_cast<int>(out.size())), 0.0f);

        // Unloading returns to the same state
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 1.0));
        expect(fx.engine->load("a.wav").ok());
        expect(fx.engine->unload().ok());
        fx.pump(kDeviceBlock);
        expect(!fx.engine->status().hasAsset());
        expect(fx.engine->play().error == loopah::ErrorKind::NoAsset);
    }

    void testDecodeFailure()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 2.0));
        expect(fx.engine->load("a.wav").ok());
        fx.pump(kDeviceBlock);

        auto result = fx.engine->load("missing.wav");
        expect(result.error == loopah::ErrorKind::DecodeError);
        fx.pump(kDeviceBlock);

        auto st = fx.engine->status();
        expect(st.hasAsset(), "Previous asset still loaded");
        expectEquals(juce::String(st.sourceName), juce::String("sine.wav"));
        expect(st.lastError == loopah::ErrorKind::DecodeError);
        expect(fx.engine->play().ok());
    }

    void testSpeedClamp()
    {
        Fixture fx(kRate, 0.25);
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 2.0));
        fx.engine->load("a.wav");

        auto result = fx.engine->setSpeed(0.01);
        expect(result.ok());
        expectEquals(result.value, 0.25);
        fx.pump(kDeviceBlock);
        expectEquals(fx.engine->status().speed, 0.25);
        expect(fx.engine->status().lastError == loopah::ErrorKind::None);

        result = fx.engine->setSpeed(10.0);
        expectEquals(result.value, 2.0);

        fx.engine->setSpeed(1.0);
        result = fx.engine->nudgeSpeed(-0.05);
        expectWithinAbsoluteError(result.value, 0.95, 1e-12);
        expectWithinAbsoluteError(fx.engine->requestedSpeed(), 0.95, 1e-12);
    }

    void testLoopRoundTrip()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 10.0));
        fx.engine->load("a.wav");
        const auto total = static_cast<int64_t>(kRate * 10);

        expect(fx.engine->setLoopFrames(1000, 5000, true).ok());
        auto loop = fx.engine->loop();
        expectEquals(static_cast<int>(loop.startFrame), 1000);
        expectEquals(static_cast<int>(loop.endFrame), 5000);
        expect(loop.enabled);

        expect(fx.engine->setLoopFrames(5000, 1000).error == loopah::ErrorKind::InvalidLoopRegion);
        expect(fx.engine->setLoopFrames(-1, 1000).error == loopah::ErrorKind::InvalidLoopRegion);
        expect(fx.engine->setLoopFrames(0, total + 1).error == loopah::ErrorKind::InvalidLoopRegion);
        expect(fx.engine->loop().startFrame == 1000 && fx.engine->loop().endFrame == 5000,
               "Rejected regions leave the old one");

        expect(fx.engine->setLoopFrames(total - 100, total).ok(), "Loop may cover the tail");
        expect(fx.engine->setLoopSeconds(9.5, 10.0).ok());
        expectEquals(fx.engine->loop().endFrame, total);

        expect(fx.engine->setLoopEnabled(false).ok());
        expect(!fx.engine->loop().enabled);
        fx.pump(kDeviceBlock);
        expect(!fx.engine->status().loop.enabled);

        // Nothing to enable after loading something new
        fx.decoder->add("b.wav", TestUtils::sineAsset(440.0, kRate, 1.0));
        fx.engine->load("b.wav");
        expect(fx.engine->setLoopEnabled(true).error == loopah::ErrorKind::InvalidLoopRegion);
    }

    void testLoopScenario()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 10.0));
        fx.engine->load("a.wav");
        expect(fx.engine->setLoopSeconds(2.0, 4.0, true).ok());
        fx.engine->setSpeed(0.5);
        fx.engine->seekSeconds(2.0);
        fx.engine->play();

        std::vector<float> out;
        std::vector<int64_t> wrapAt;
        int64_t lastCount = 0;
        int64_t outputFrames = 0;
        bool insideLoop = true;

        const int total = static_cast<int>(kRate * 13);
        for (int done = 0; done < total; done += kDeviceBlock)
        {
            fx.pump(kDeviceBlock, &out);
            outputFrames += kDeviceBlock;

            auto st = fx.engine->status();
            if (st.loopCount != lastCount)
            {
                wrapAt.push_back(outputFrames);
                lastCount = st.loopCount;
            }
            if (st.positionSeconds < 2.0 - 1e-6 || st.positionSeconds > 4.0 + 1e-6)
                insideLoop = false;
        }

        expect(insideLoop, "Playhead stays inside the loop");
        expect(fx.engine->status().state == loopah::TransportState::Playing, "Loops until stopped");
        expectEquals(static_cast<int>(wrapAt.size()), 3, "Three passes complete in 13 s");

        const double cycle = kRate * 4.0;
        for (size_t i = 1; i < wrapAt.size(); ++i)
            expectWithinAbsoluteError(static_cast<double>(wrapAt[i] - wrapAt[i - 1]), cycle, 1024.0,
                                      "Cycle length");

        // Pitch unchanged in the middle of a pass
        const auto mid = static_cast<size_t>(wrapAt.empty() ? kRate * 6 : wrapAt[0] + kRate);
        if (mid + static_cast<size_t>(kRate) <= out.size())
        {
            double f = TestUtils::estimateFrequency(out.data() + mid, static_cast<int>(kRate), kRate);
            expectWithinAbsoluteError(f, 440.0, 440.0 * 0.02, "Pitch preserved at half speed");
        }

        float peak = 0.0f, jump = 0.0f;
        for (size_t i = 1; i < out.size(); ++i)
        {
            peak = std::max(peak, std::abs(out[i]));
            jump = std::max(jump, std::abs(out[i] - out[i - 1]));
        }
        expectLessThan(peak, 0.75f, "No blow-up at the seams");
        expectLessThan(jump, 0.75f, "Bounded jump at the seams");

        fx.engine->stop();
        fx.pump(kDeviceBlock);
        auto st = fx.engine->status();
        expect(st.state == loopah::TransportState::Stopped);
        expectWithinAbsoluteError(st.positionSeconds, 2.0, 1e-9, "Stop returns to the loop start");
    }

    void testLoopTailHeard()
    {
        // Silence except for a tone in the last 50 ms of the loop [1 s, 2 s)
        const auto total = static_cast<int64_t>(kRate * 3);
        const auto toneStart = static_cast<int64_t>(kRate * 1.95);
        const auto loopEnd = static_cast<int64_t>(kRate * 2);
        auto tone = TestUtils::sine(440.0, kRate, loopEnd - toneStart);
        std::vector<float> pcm(static_cast<size_t>(total), 0.0f);
        std::copy(tone.begin(), tone.end(), pcm.begin() + toneStart);

        for (double speed : { 1.0, 0.5 })
        {
            Fixture fx;
            fx.decoder->add("a.wav", loopah::AudioAsset::fromInterleaved(pcm, 1, kRate, "tail.wav"));
            fx.engine->load("a.wav");
            fx.engine->setSpeed(speed);
            fx.engine->setLoopSeconds(1.0, 2.0, true);
            fx.engine->seekSeconds(1.0);
            fx.engine->play();

            const int passes = 4;
            const auto passFrames = static_cast<size_t>(kRate / speed);
            std::vector<float> out;
            fx.pump(static_cast<int>(passFrames * passes + passFrames / 4), &out);

            for (int pass = 0; pass < passes; ++pass)
            {
                const size_t begin = passFrames * static_cast<size_t>(pass);
                const auto middle = static_cast<int>(passFrames * 4 / 10);
                const auto tail = static_cast<int>(passFrames * 4 / 10);
                const juce::String label = "pass " + juce::String(pass) + " at speed " + juce::String(speed);

                expectLessThan(TestUtils::rms(out.data() + begin + passFrames / 5, middle), 0.02f,
                               "Silent middle, " + label);
                expectGreaterThan(TestUtils::rms(out.data() + begin + passFrames * 7 / 10, tail), 0.05f,
                                  "Loop tail heard, " + label);
            }
        }
    }

    void testSeekFlushes()
    {
        // Silence for two seconds, then a tone
        const auto half = static_cast<int64_t>(kRate * 2);
        std::vector<float> pcm(static_cast<size_t>(half), 0.0f);
        auto tone = TestUtils::sine(440.0, kRate, half);
        pcm.insert(pcm.end(), tone.begin(), tone.end());

        Fixture fx;
        fx.decoder->add("a.wav", loopah::AudioAsset::fromInterleaved(pcm, 1, kRate, "split.wav"));
        fx.engine->load("a.wav");
        fx.engine->seekSeconds(2.5);
        fx.engine->play();

        std::vector<float> out;
        fx.pump(static_cast<int>(kRate / 2), &out);
        expectGreaterThan(TestUtils::rms(out.data() + out.size() / 2, static_cast<int>(out.size() / 2)), 0.1f);

        fx.engine->seekSeconds(0.5);
        out.clear();
        fx.pump(2048, &out);
        expectLessThan(TestUtils::rms(out.data(), static_cast<int>(out.size())), 1e-4f,
                       "Only post-seek audio is heard");

        auto st = fx.engine->status();
        expect(st.positionSeconds >= 0.5 && st.positionSeconds < 0.6);
    }

    void testPauseResumeStop()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 10.0));
        fx.engine->load("a.wav");
        fx.engine->seekSeconds(1.0);
        fx.engine->play();
        fx.pump(static_cast<int>(kRate));

        fx.engine->pause();
        fx.pump(kDeviceBlock);
        auto st = fx.engine->status();
        expect(st.state == loopah::TransportState::Paused);
        expectWithinAbsoluteError(st.positionSeconds, 2.0, 0.15, "Paused where playback was heard");
        const double pausedAt = st.positionSeconds;

        auto underruns = st.underrunCount;
        std::vector<float> out;
        expectEquals(fx.pump(4096, &out), 0, "Paused output is silence");
        expectEquals(TestUtils::rms(out.data(), static_cast<int>(out.size())), 0.0f);
        expectEquals(fx.engine->status().underrunCount, underruns, "Silence while paused is not an underrun");
        expectEquals(fx.engine->status().positionSeconds, pausedAt);

        fx.engine->play();
        fx.pump(static_cast<int>(kRate / 2));
        st = fx.engine->status();
        expect(st.state == loopah::TransportState::Playing);
        expect(st.positionSeconds > pausedAt, "Resumed from the paused position");
        expect(st.positionSeconds < pausedAt + 0.6);

        fx.engine->stop();
        fx.pump(kDeviceBlock);
        st = fx.engine->status();
        expect(st.state == loopah::TransportState::Stopped);
        expectEquals(st.positionSeconds, 0.0);
    }

    void testEndOfFile()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 0.5));
        fx.engine->load("a.wav");
        fx.engine->play();

        int got = fx.pump(static_cast<int>(kRate));
        expectWithinAbsoluteError(static_cast<double>(got), kRate * 0.5, 2048.0,
                                  "Whole file heard once");
        auto st = fx.engine->status();
        expect(st.state == loopah::TransportState::Stopped);
        expect(fx.heard("Stopped at end of file"));
        expectEquals(static_cast<int>(st.underrunCount), 0);
        expect(st.lastError == loopah::ErrorKind::None);
    }

    void testRateMismatch()
    {
        const double deviceRate = 48000.0;
        Fixture fx(deviceRate);
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 4.0));
        fx.engine->load("a.wav");
        fx.engine->play();

        std::vector<float> out;
        fx.pump(static_cast<int>(deviceRate * 2), &out);

        const int from = static_cast<int>(deviceRate);
        double f = TestUtils::estimateFrequency(out.data() + from, static_cast<int>(deviceRate) / 2, deviceRate);
        expectWithinAbsoluteError(f, 440.0, 440.0 * 0.02);

        // Two seconds of output is two seconds of source at unit speed
        expectWithinAbsoluteError(fx.engine->status().positionSeconds, 2.0, 0.15);
    }

    void testCommandQueueFull()
    {
        Fixture fx;
        bool sawFull = false;
        for (int i = 0; i < 400 && !sawFull; ++i)
        {
            auto result = fx.engine->setSpeed(1.0);
            if (result.error == loopah::ErrorKind::CommandQueueFull)
                sawFull = true;
        }
        expect(sawFull, "Render thread not draining fills the channel");
        expect(fx.engine->status().lastError == loopah::ErrorKind::CommandQueueFull);

        fx.engine->renderCycle();
        expect(fx.engine->setSpeed(1.5).ok(), "Draining frees the channel");
    }

    void testRenderFailure()
    {
        Fixture fx;
        const int channels = loopah::TimeStretcher::kMaxChannels + 2;
        auto asset = loopah::AudioAsset::fromInterleaved(
            std::vector<float>(static_cast<size_t>(channels * 1000), 0.1f), channels, kRate, "wide.wav");

        expect(fx.engine->loadAsset(asset).ok());
        fx.pump(kDeviceBlock);

        auto st = fx.engine->status();
        expect(st.lastError == loopah::ErrorKind::RenderFailure);
        expect(st.state == loopah::TransportState::Stopped);

        fx.engine->clearError();
        expect(fx.engine->status().lastError == loopah::ErrorKind::None);
    }

    void testRenderThread()
    {
        Fixture fx;
        fx.decoder->add("a.wav", TestUtils::sineAsset(440.0, kRate, 5.0));
        fx.engine->startRendering();
        expect(fx.engine->isRendering());

        fx.engine->load("a.wav");
        fx.engine->play();

        std::vector<float> left(kDeviceBlock), right(kDeviceBlock);
        float* outs[] = { left.data(), right.data() };
        int got = 0;
        for (int i = 0; i < 200; ++i)
        {
            got += fx.engine->renderOutput(outs, 2, kDeviceBlock);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        fx.engine->stopRendering();
        expect(!fx.engine->isRendering());
        expect(got > 0, "Render thread fed the callback");
        expect(fx.engine->status().state == loopah::TransportState::Playing);
    }
};

int main(int argc, char* argv[])
{
    (void)argc; (void)argv;
    PlayerEngineTests tests;
    return TestUtils::runSuite(tests);
}
