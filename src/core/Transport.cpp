#include "core/Transport.h"

#include <algorithm>
#include <cmath>

namespace loopah {

void Transport::setAsset(int64_t totalFrames, double sourceToOutputRate) {
    totalFrames_ = std::max<int64_t>(totalFrames, 0);
    rateRatio_ = (std::isfinite(sourceToOutputRate) && sourceToOutputRate > 0.0)
        ? sourceToOutputRate : 1.0;
    state_ = TransportState::Stopped;
    position_ = 0.0;
    loop_ = LoopRegion{};
    wrapCount_ = 0;
    requestReset();
    flushRequested_ = true;
}

void Transport::setSpeedLimits(const SpeedLimits& limits) {
    limits_ = limits;
    speed_ = limits_.clamp(speed_);
}

void Transport::play() {
    if (totalFrames_ <= 0) return;
    state_ = TransportState::Playing;
}

void Transport::pause() {
    if (state_ == TransportState::Playing) {
        state_ = TransportState::Paused;
    }
}

void Transport::stop() {
    state_ = TransportState::Stopped;
    position_ = loopActive() ? static_cast<double>(loop_.startFrame) : 0.0;
    requestReset();
    flushRequested_ = true;
}

void Transport::seek(double frame) {
    if (totalFrames_ <= 0) return;
    position_ = foldPosition(frame);
    requestReset();
    flushRequested_ = true;
}

bool Transport::setLoop(const LoopRegion& region) {
    if (!region.isValid() || region.endFrame > totalFrames_) {
        return false;
    }

    const bool toggled = region.enabled != loop_.enabled;
    loop_ = region;
    if (loopActive() && !loop_.contains(position_)) {
        position_ = foldPosition(position_);
        requestReset();
        flushRequested_ = true;
    } else if (toggled) {
        requestReset();
    }
    return true;
}

void Transport::setLoopEnabled(bool enabled) {
    if (loop_.enabled == enabled) return;
    loop_.enabled = enabled;
    requestReset();

    if (loopActive() && !loop_.contains(position_)) {
        position_ = foldPosition(position_);
        flushRequested_ = true;
    }
}

double Transport::setSpeed(double ratio) {
    double applied = limits_.clamp(ratio);
    double jump = std::abs(applied - speed_) / speed_;
    if (jump > speedResetThreshold_) {
        requestReset();
    }
    speed_ = applied;
    return applied;
}

void Transport::advance(int outputFrames, RenderPlan& plan) {
    plan.clear();
    if (outputFrames <= 0) return;

    if (state_ != TransportState::Playing || totalFrames_ <= 0) {
        plan.silentFrames = outputFrames;
        return;
    }

    const double step = inputPerOutput();
    int remaining = outputFrames;
    bool wrapped = false;

    while (remaining > 0 && !plan.full()) {
        const bool looping = loopActive();
        const double boundary = static_cast<double>(looping ? loop_.endFrame : totalFrames_);
        const double available = boundary - position_;

        if (available <= 0.0) {
            if (looping) {
                // The seam is always a discontinuity for the stretcher
                position_ = static_cast<double>(loop_.startFrame);
                ++wrapCount_;
                requestReset();
                wrapped = true;
                continue;
            }
            plan.reachedEnd = true;
            plan.silentFrames = remaining;
            finishAtEnd();
            return;
        }

        RenderSegment seg;
        seg.resetBefore = needsReset_;
        seg.wrapped = wrapped;
        seg.sourceStart = static_cast<int64_t>(std::floor(position_));
        needsReset_ = false;
        wrapped = false;

        const double wanted = static_cast<double>(remaining) * step;
        if (wanted < available) {
            int64_t end = static_cast<int64_t>(std::floor(position_ + wanted));
            seg.outputFrames = remaining;
            seg.sourceFrames = static_cast<int>(end - seg.sourceStart);
            position_ += wanted;
        } else {
            // Consume exactly up to the boundary. The fractional overshoot of
            // the last output frame is dropped so each pass covers [start, end).
            int out = static_cast<int>(std::ceil(available / step));
            seg.outputFrames = std::clamp(out, 1, remaining);
            seg.sourceFrames = static_cast<int>(static_cast<int64_t>(boundary) - seg.sourceStart);
            position_ = boundary;
        }

        remaining -= seg.outputFrames;
        plan.add(seg);

        if (!looping && position_ >= static_cast<double>(totalFrames_)) {
            plan.reachedEnd = true;
            plan.silentFrames = remaining;
            finishAtEnd();
            return;
        }
    }
}

bool Transport::consumeFlushRequest() {
    bool requested = flushRequested_;
    flushRequested_ = false;
    return requested;
}

double Transport::foldPosition(double frame) const {
    if (!std::isfinite(frame)) frame = 0.0;
    double last = static_cast<double>(std::max<int64_t>(totalFrames_ - 1, 0));
    frame = std::clamp(frame, 0.0, last);

    if (loopActive()) {
        const double start = static_cast<double>(loop_.startFrame);
        if (frame < start) return start;
        if (frame >= static_cast<double>(loop_.endFrame)) {
            return start + std::fmod(frame - start, static_cast<double>(loop_.length()));
        }
    }
    return frame;
}

void Transport::finishAtEnd() {
    // Already queued audio is the tail of the file, so no flush
    state_ = TransportState::Stopped;
    position_ = 0.0;
    requestReset();
}

void Transport::requestReset() {
    needsReset_ = true;
}

} // namespace loopah
