#include "core/TimeStretcher.h"
#include "signalsmith-stretch.h"

#include <algorithm>
#include <cmath>

namespace loopah {

struct TimeStretcher::Impl {
    signalsmith::stretch::SignalsmithStretch<float> stretch;
};

TimeStretcher::TimeStretcher() : impl_(std::make_unique<Impl>()) {}
TimeStretcher::~TimeStretcher() = default;
TimeStretcher::TimeStretcher(TimeStretcher&&) noexcept = default;
TimeStretcher& TimeStretcher::operator=(TimeStretcher&&) noexcept = default;

void TimeStretcher::configure(int channels, double sampleRate, StretchPreset preset) {
    channels_ = std::clamp(channels, 1, kMaxChannels);
    if (preset == StretchPreset::Default) {
        impl_->stretch.presetDefault(channels_, static_cast<float>(sampleRate));
    } else {
        impl_->stretch.presetCheaper(channels_, static_cast<float>(sampleRate));
    }
    impl_->stretch.reset();
    configured_ = true;
}

void TimeStretcher::process(const float* const* input, int inputFrames,
                            float* const* output, int outputFrames) {
    if (!configured_ || outputFrames <= 0) return;
    impl_->stretch.process(input, std::max(inputFrames, 0), output, outputFrames);
}

void TimeStretcher::reset() {
    impl_->stretch.reset();
}

void TimeStretcher::setRateCompensation(double ratio) {
    if (!std::isfinite(ratio) || ratio <= 0.0) ratio = 1.0;
    // Asset samples played at the device rate are shifted by 1/ratio; undo it
    impl_->stretch.setTransposeFactor(static_cast<float>(ratio));
}

int TimeStretcher::inputLatency() const {
    return configured_ ? impl_->stretch.inputLatency() : 0;
}

int TimeStretcher::outputLatency() const {
    return configured_ ? impl_->stretch.outputLatency() : 0;
}

int TimeStretcher::primeLength(double step) const {
    if (!configured_) return 0;
    return inputLatency() + static_cast<int>(std::lround(outputLatency() * step));
}

void TimeStretcher::prime(const float* const* input, double step, float* const* scratch) {
    if (!configured_) return;
    const int seekFrames = inputLatency();
    const int settleFrames = outputLatency();
    const int settleInput = primeLength(step) - seekFrames;

    impl_->stretch.seek(input, seekFrames, step);

    // Run the output delay off into scratch
    const float* rest[kMaxChannels];
    for (int ch = 0; ch < channels_; ++ch) {
        rest[ch] = input[ch] + seekFrames;
    }
    impl_->stretch.process(rest, settleInput, scratch, settleFrames);
}

} // namespace loopah
