#pragma once

#include "core/PlaybackTypes.h"

#include <array>
#include <cstdint>

namespace loopah {

/// One contiguous run of source frames and the output frames it must become.
struct RenderSegment {
    int64_t sourceStart = 0;
    int sourceFrames = 0;
    int outputFrames = 0;
    bool resetBefore = false;   // Stretcher history must be cleared first
    bool wrapped = false;       // Segment starts at the loop start after a wrap
};

/// Segment list produced by Transport::advance for one request.
/// Fixed capacity so planning never allocates.
struct RenderPlan {
    static constexpr int kMaxSegments = 16;

    std::array<RenderSegment, kMaxSegments> segments{};
    int count = 0;
    int plannedFrames = 0;   // Output frames covered by segments
    int silentFrames = 0;    // Trailing output frames with no source (stopped, end of file)
    bool reachedEnd = false; // Playback ran off the end of the asset this request

    void clear() {
        count = 0;
        plannedFrames = 0;
        silentFrames = 0;
        reachedEnd = false;
    }

    bool full() const { return count >= kMaxSegments; }

    void add(const RenderSegment& seg) {
        segments[static_cast<size_t>(count++)] = seg;
        plannedFrames += seg.outputFrames;
    }
};

/// Playback position / loop / speed state machine.
///
/// Owned by the render thread. The control side never touches it directly;
/// its commands are applied between render cycles.
class Transport {
public:
    Transport() = default;

    /// Attach a new asset (0 frames detaches). Resets to Stopped at frame 0
    /// with looping cleared.
    /// @param sourceToOutputRate asset sample rate / device sample rate
    void setAsset(int64_t totalFrames, double sourceToOutputRate = 1.0);

    void setSpeedLimits(const SpeedLimits& limits);
    const SpeedLimits& speedLimits() const { return limits_; }

    /// Relative speed change above which the stretcher is reset
    void setSpeedResetThreshold(double threshold) { speedResetThreshold_ = threshold; }
    double speedResetThreshold() const { return speedResetThreshold_; }

    // --- State machine ---
    void play();
    void pause();
    void stop();
    void seek(double frame);

    /// Apply a new loop region. Regions that do not fit the current asset are
    /// ignored and the previous region is kept. Returns true if applied.
    bool setLoop(const LoopRegion& region);
    void setLoopEnabled(bool enabled);

    /// Set speed, clamped to the limits. Returns the applied value.
    double setSpeed(double ratio);

    /// Plan up to outputFrames of output at the current speed.
    /// Segments never cross the loop end; after a wrap the next segment starts
    /// exactly at the loop start and is flagged resetBefore.
    /// Fewer frames may be planned if the plan fills up; call again for the rest.
    void advance(int outputFrames, RenderPlan& plan);

    // --- Queries ---
    TransportState state() const { return state_; }
    bool isPlaying() const { return state_ == TransportState::Playing; }
    double position() const { return position_; }
    double speed() const { return speed_; }
    const LoopRegion& loop() const { return loop_; }
    int64_t totalFrames() const { return totalFrames_; }
    bool loopActive() const { return loop_.enabled && loop_.isValid(); }

    /// Source frames consumed per output frame
    double inputPerOutput() const { return speed_ * rateRatio_; }

    /// Number of loop wraps since the asset was attached
    int64_t wrapCount() const { return wrapCount_; }

    /// True once after a command moved the position discontinuously
    /// (queued output from before it is stale)
    bool consumeFlushRequest();

private:
    /// Fold a position into the loop region (if active) or the asset bounds
    double foldPosition(double frame) const;

    /// Ran off the end of the asset without looping
    void finishAtEnd();

    /// Mark a discontinuity: stretcher reset before the next segment
    void requestReset();

    TransportState state_ = TransportState::Stopped;
    double position_ = 0.0;
    double speed_ = 1.0;
    double rateRatio_ = 1.0;
    int64_t totalFrames_ = 0;
    LoopRegion loop_;
    SpeedLimits limits_;
    double speedResetThreshold_ = 0.5;

    bool needsReset_ = true;
    bool flushRequested_ = false;
    int64_t wrapCount_ = 0;
};

} // namespace loopah
