#include "core/Transport.h"
#include "TestUtils.h"

#include <juce_core/juce_core.h>

#include <vector>

class TransportTests : public juce::UnitTest
{
public:
    TransportTests() : juce::UnitTest("TransportTests") {}

    void runTest() override
    {
        beginTest("State machine");
        testStateMachine();

        beginTest("Stop rewinds to the loop start");
        testStopRewinds();

        beginTest("Seek clamps and folds into the loop");
        testSeek();

        beginTest("Loop coverage is exact every pass");
        testLoopCoverage();

        beginTest("Loop coverage at fractional speed");
        testLoopCoverageFractional();

        beginTest("Invalid loop regions are ignored");
        testInvalidLoop();

        beginTest("New loop region moves the position inside it");
        testLoopMovesPosition();

        beginTest("Toggling the loop resets the stretcher");
        testLoopToggleResets();

        beginTest("Speed clamping and reset threshold");
        testSpeed();

        beginTest("End of file stops playback");
        testEndOfFile();

        beginTest("Rate compensation scales source consumption");
        testRateRatio();
    }

private:
    static loopah::LoopRegion region(int64_t a, int64_t b, bool enabled = true)
    {
        loopah::LoopRegion r;
        r.startFrame = a;
        r.endFrame = b;
        r.enabled = enabled;
        return r;
    }

    // Source frames covered by each loop pass, collected from render plans
    static std::vector<std::vector<int64_t>> collectPasses(loopah::Transport& t, int blocks, int blockFrames)
    {
        std::vector<std::vector<int64_t>> passes(1);
        loopah::RenderPlan plan;
        for (int b = 0; b < blocks; ++b)
        {
            int remaining = blockFrames;
            while (remaining > 0)
            {
                t.advance(remaining, plan);
                if (plan.count == 0) break;
                for (int s = 0; s < plan.count; ++s)
                {
                    const auto& seg = plan.segments[static_cast<size_t>(s)];
                    if (seg.wrapped) passes.emplace_back();
                    for (int i = 0; i < seg.sourceFrames; ++i)
                        passes.back().push_back(seg.sourceStart + i);
                }
                remaining -= plan.plannedFrames;
            }
        }
        return passes;
    }

    void expectContiguous(const std::vector<int64_t>& frames, int64_t a, int64_t b)
    {
        expectEquals(static_cast<int>(frames.size()), static_cast<int>(b - a), "Pass length");
        bool ordered = true;
        for (size_t i = 0; i < frames.size(); ++i)
            if (frames[i] != a + static_cast<int64_t>(i)) ordered = false;
        expect(ordered, "No skipped or duplicated frames");
    }

    void testStateMachine()
    {
        loopah::Transport t;
        t.play();
        expect(t.state() == loopah::TransportState::Stopped, "No asset, no playback");

        t.setAsset(1000);
        expect(t.consumeFlushRequest(), "Attaching an asset flushes");
        t.play();
        expect(t.isPlaying());

        t.pause();
        expect(t.state() == loopah::TransportState::Paused);
        t.pause();
        expect(t.state() == loopah::TransportState::Paused);

        t.play();
        expect(t.isPlaying());

        loopah::RenderPlan plan;
        t.pause();
        t.advance(64, plan);
        expectEquals(plan.count, 0);
        expectEquals(plan.silentFrames, 64, "Paused renders silence");
    }

    void testStopRewinds()
    {
        loopah::Transport t;
        t.setAsset(10000);
        t.consumeFlushRequest();
        t.seek(5000.0);
        t.play();
        t.stop();
        expect(t.state() == loopah::TransportState::Stopped);
        expectEquals(t.position(), 0.0);
        expect(t.consumeFlushRequest());

        t.setLoop(region(2000, 4000));
        t.seek(3000.0);
        t.stop();
        expectEquals(t.position(), 2000.0, "With a loop, stop goes to its start");
    }

    void testSeek()
    {
        loopah::Transport t;
        t.setAsset(10000);
        t.consumeFlushRequest();

        t.seek(-50.0);
        expectEquals(t.position(), 0.0);
        t.seek(20000.0);
        expectEquals(t.position(), 9999.0, "Clamped to the last frame");
        expect(t.consumeFlushRequest(), "Seek discards queued audio");

        t.setLoop(region(1000, 2000));
        t.seek(500.0);
        expectEquals(t.position(), 1000.0, "Before the loop goes to its start");
        t.seek(2250.0);
        expectEquals(t.position(), 1250.0, "Past the loop folds by its length");
        t.seek(1500.0);
        expectEquals(t.position(), 1500.0);

        loopah::RenderPlan plan;
        t.play();
        t.advance(16, plan);
        expect(plan.segments[0].resetBefore, "First segment after a seek resets the stretcher");
        expectEquals(static_cast<int>(plan.segments[0].sourceStart), 1500);
    }

    void testLoopCoverage()
    {
        loopah::Transport t;
        t.setAsset(10000);
        t.setLoop(region(1000, 1500));
        t.seek(1000.0);
        t.play();

        auto passes = collectPasses(t, 40, 64);
        expect(passes.size() >= 4, "Several passes rendered");
        for (size_t p = 1; p + 1 < passes.size(); ++p)
            expectContiguous(passes[p], 1000, 1500);
        expect(t.wrapCount() >= 4);
    }

    void testLoopCoverageFractional()
    {
        loopah::Transport t;
        t.setAsset(44100 * 10);
        t.setLoop(region(44100 * 2, 44100 * 2 + 3001));
        t.seek(44100.0 * 2);
        t.setSpeed(0.7);
        t.play();

        auto passes = collectPasses(t, 60, 256);
        expect(passes.size() >= 3);
        for (size_t p = 1; p + 1 < passes.size(); ++p)
            expectContiguous(passes[p], 44100 * 2, 44100 * 2 + 3001);

        // Wrap segments are flagged for a stretcher reset
        loopah::RenderPlan plan;
        bool sawWrapReset = false;
        for (int i = 0; i < 200 && !sawWrapReset; ++i)
        {
            t.advance(256, plan);
            for (int s = 0; s < plan.count; ++s)
                if (plan.segments[static_cast<size_t>(s)].wrapped)
                    sawWrapReset = plan.segments[static_cast<size_t>(s)].resetBefore;
        }
        expect(sawWrapReset);
    }

    void testInvalidLoop()
    {
        loopah::Transport t;
        t.setAsset(1000);
        expect(t.setLoop(region(100, 200)));
        expect(!t.setLoop(region(300, 300)), "Empty region");
        expect(!t.setLoop(region(400, 300)), "Reversed region");
        expect(!t.setLoop(region(900, 1001)), "Past the end");
        expect(t.loop() == region(100, 200), "Previous region kept");
        expect(t.setLoop(region(900, 1000)), "Region may end exactly at the last frame");
    }

    void testLoopMovesPosition()
    {
        loopah::Transport t;
        t.setAsset(10000);
        t.seek(5000.0);
        t.consumeFlushRequest();

        t.setLoop(region(1000, 2000));
        expect(t.loop().contains(t.position()));
        expect(t.consumeFlushRequest());

        t.seek(1500.0);
        t.consumeFlushRequest();
        t.setLoopEnabled(false);
        t.seek(6000.0);
        t.consumeFlushRequest();
        t.setLoopEnabled(true);
        expect(t.loop().contains(t.position()), "Enabling folds the position into the region");

        t.seek(1200.0);
        t.consumeFlushRequest();
        t.setLoopEnabled(false);
        expectEquals(t.position(), 1200.0);
        expect(!t.consumeFlushRequest(), "Disabling does not move the position");
    }

    void testLoopToggleResets()
    {
        loopah::Transport t;
        t.setAsset(400000);
        t.setLoop(region(0, 200000));
        t.play();

        loopah::RenderPlan plan;
        t.advance(512, plan);
        t.advance(512, plan);
        expect(!plan.segments[0].resetBefore);

        t.setLoopEnabled(false);
        t.advance(512, plan);
        expect(plan.segments[0].resetBefore, "Disabling the loop");
        expect(!t.consumeFlushRequest(), "Position unchanged, queued audio kept");

        t.advance(512, plan);
        expect(!plan.segments[0].resetBefore);

        t.setLoopEnabled(true);
        t.advance(512, plan);
        expect(plan.segments[0].resetBefore, "Enabling the loop");

        t.setLoop(region(0, 200000, false));
        t.advance(512, plan);
        expect(plan.segments[0].resetBefore, "Disabling through a new region");

        t.setLoop(region(0, 300000, false));
        t.advance(512, plan);
        expect(!plan.segments[0].resetBefore, "Same flag, position inside");
    }

    void testSpeed()
    {
        loopah::Transport t;
        loopah::SpeedLimits limits;
        limits.minSpeed = 0.25;
        limits.maxSpeed = 2.0;
        t.setSpeedLimits(limits);
        t.setAsset(10000);
        t.play();

        expectEquals(t.setSpeed(0.01), 0.25);
        expectEquals(t.setSpeed(5.0), 2.0);
        expectEquals(t.setSpeed(std::nan("")), 0.25);

        loopah::RenderPlan plan;
        t.setSpeed(1.0);
        t.advance(64, plan);
        t.setSpeed(1.1);
        t.advance(64, plan);
        expect(!plan.segments[0].resetBefore, "Small speed change keeps stretcher history");

        t.setSpeed(2.0);
        t.advance(64, plan);
        expect(plan.segments[0].resetBefore, "Large jump resets the stretcher");

        double before = t.position();
        t.setSpeed(0.5);
        t.advance(100, plan);
        expectWithinAbsoluteError(t.position() - before, 50.0, 1e-9);
    }

    void testEndOfFile()
    {
        loopah::Transport t;
        t.setAsset(1000);
        t.seek(900.0);
        t.consumeFlushRequest();
        t.play();

        loopah::RenderPlan plan;
        t.advance(256, plan);
        expect(plan.reachedEnd);
        expectEquals(plan.plannedFrames, 100);
        expectEquals(plan.silentFrames, 156);
        expect(t.state() == loopah::TransportState::Stopped);
        expectEquals(t.position(), 0.0);
        expect(!t.consumeFlushRequest(), "The tail already queued still plays");
    }

    void testRateRatio()
    {
        loopah::Transport t;
        t.setAsset(100000, 44100.0 / 48000.0);
        t.play();
        loopah::RenderPlan plan;
        t.advance(4800, plan);
        expectWithinAbsoluteError(t.position(), 4410.0, 1e-6);
        expectWithinAbsoluteError(t.inputPerOutput(), 44100.0 / 48000.0, 1e-12);
    }
};

int main(int argc, char* argv[])
{
    (void)argc; (void)argv;
    TransportTests tests;
    return TestUtils::runSuite(tests);
}
