#include "core/SampleStore.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace loopah {

int64_t AudioAsset::read(int64_t startFrame, int64_t frameCount, float* dest) const {
    if (frameCount <= 0 || channels <= 0) return 0;
    if (startFrame < 0 || startFrame >= frames) return 0;

    int64_t count = std::min(frameCount, frames - startFrame);
    std::memcpy(dest, samples.data() + startFrame * channels,
                static_cast<size_t>(count * channels) * sizeof(float));
    return count;
}

int AudioAsset::readPlanar(int64_t startFrame, int frameCount, float* const* dest) const {
    if (frameCount <= 0 || channels <= 0) return 0;

    for (int ch = 0; ch < channels; ++ch) {
        std::fill(dest[ch], dest[ch] + frameCount, 0.0f);
    }

    // Leading frames before 0 stay silent
    int64_t first = std::max<int64_t>(startFrame, 0);
    int64_t last = std::min<int64_t>(startFrame + frameCount, frames);
    if (first >= last) return 0;

    int offset = static_cast<int>(first - startFrame);
    const float* src = samples.data() + first * channels;
    int count = static_cast<int>(last - first);
    for (int i = 0; i < count; ++i) {
        for (int ch = 0; ch < channels; ++ch) {
            dest[ch][offset + i] = *src++;
        }
    }
    return count;
}

std::vector<float> AudioAsset::previewBuckets(int buckets) const {
    if (buckets <= 0 || preview.empty()) return {};
    if (static_cast<size_t>(buckets) >= preview.size()) return preview;

    std::vector<float> out(static_cast<size_t>(buckets), 0.0f);
    const double per = static_cast<double>(preview.size()) / buckets;
    for (size_t i = 0; i < preview.size(); ++i) {
        auto b = std::min(static_cast<size_t>(static_cast<double>(i) / per), out.size() - 1);
        out[b] = std::max(out[b], preview[i]);
    }
    return out;
}

std::shared_ptr<const AudioAsset> AudioAsset::fromInterleaved(std::vector<float> interleaved,
                                                              int channels,
                                                              double sampleRate,
                                                              std::string sourceName) {
    auto asset = std::make_shared<AudioAsset>();
    asset->sampleRate = sampleRate;
    asset->channels = std::max(channels, 1);
    asset->frames = static_cast<int64_t>(interleaved.size()) / asset->channels;
    interleaved.resize(static_cast<size_t>(asset->frames * asset->channels));
    asset->samples = std::move(interleaved);
    asset->sourceName = std::move(sourceName);

    // RMS overview of the mono mix. The last partial window is kept.
    int windowFrames = std::max(1, static_cast<int>(sampleRate * kPreviewWindowSeconds));
    asset->preview.reserve(static_cast<size_t>(asset->frames / windowFrames + 1));
    double accSq = 0.0;
    int accCount = 0;
    const float* src = asset->samples.data();
    for (int64_t f = 0; f < asset->frames; ++f) {
        float sum = 0.0f;
        for (int ch = 0; ch < asset->channels; ++ch) {
            sum += *src++;
        }
        double mono = static_cast<double>(sum) / asset->channels;
        accSq += mono * mono;
        if (++accCount == windowFrames) {
            asset->preview.push_back(static_cast<float>(std::sqrt(accSq / accCount)));
            accSq = 0.0;
            accCount = 0;
        }
    }
    if (accCount > 0) {
        asset->preview.push_back(static_cast<float>(std::sqrt(accSq / accCount)));
    }

    return asset;
}

void SampleStore::publish(std::shared_ptr<const AudioAsset> asset) {
    std::atomic_store_explicit(&asset_, std::move(asset), std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

std::shared_ptr<const AudioAsset> SampleStore::acquire() const {
    return std::atomic_load_explicit(&asset_, std::memory_order_acquire);
}

} // namespace loopah
