#pragma once

#include "core/PlaybackTypes.h"

#include <memory>

namespace loopah {

/// Signalsmith Stretch configuration presets
enum class StretchPreset {
    Default,   // Better quality, higher latency
    Cheaper    // Lower CPU and latency
};

/// Wrapper around Signalsmith Stretch for pitch-preserving time stretching.
/// Uses pimpl to isolate the Signalsmith header from consumers.
///
/// The stretcher carries history between process() calls. Any discontinuity
/// in the input stream (seek, loop wrap, asset swap) must be followed by
/// reset(), otherwise audio from the old position bleeds into the new one.
///
/// Output trails input by inputLatency() + outputLatency() * step source
/// frames. After reset(), prime() with that much input from the new position
/// and keep feeding input that far ahead: the next output frame is then the
/// new position itself, with no fade-in, and nothing fed before a later
/// reset is lost.
class TimeStretcher {
public:
    static constexpr double kMinSpeed = 0.125;
    static constexpr double kMaxSpeed = 2.0;
    static constexpr int kMaxChannels = 8;

    TimeStretcher();
    ~TimeStretcher();

    // Non-copyable, movable
    TimeStretcher(const TimeStretcher&) = delete;
    TimeStretcher& operator=(const TimeStretcher&) = delete;
    TimeStretcher(TimeStretcher&&) noexcept;
    TimeStretcher& operator=(TimeStretcher&&) noexcept;

    /// Configure for the given channel count (1..kMaxChannels) and sample rate.
    /// Clears all internal state.
    void configure(int channels, double sampleRate,
                   StretchPreset preset = StretchPreset::Cheaper);

    /// Process a block of planar audio through the stretcher.
    /// The ratio of inputFrames to outputFrames determines the time stretch:
    /// more input than output = speed up; less input = slow down.
    /// Pitch is preserved regardless of the ratio.
    void process(const float* const* input, int inputFrames,
                 float* const* output, int outputFrames);

    /// Clear buffered history. Call on every input discontinuity.
    void reset();

    /// Source frames prime() consumes at `step` source frames per output frame
    int primeLength(double step) const;

    /// Fill the history from `input` (primeLength(step) frames starting at the
    /// playback point) so that output starts at that point.
    /// `scratch` receives outputLatency() discarded frames per channel.
    void prime(const float* const* input, double step, float* const* scratch);

    /// Compensate an asset/device sample rate mismatch.
    /// ratio = assetSampleRate / deviceSampleRate; 1.0 disables compensation.
    void setRateCompensation(double ratio);

    /// Input frames the stretcher holds back, and output delay in frames
    int inputLatency() const;
    int outputLatency() const;

    /// Whether configure() has been called
    bool isConfigured() const { return configured_; }
    int channels() const { return channels_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool configured_ = false;
    int channels_ = 0;
};

} // namespace loopah
