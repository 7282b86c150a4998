#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace loopah {

/// Fully decoded PCM for one loaded recording.
/// Immutable once built; shared between the control side and the render thread.
struct AudioAsset {
    double sampleRate = 44100.0;
    int channels = 0;
    int64_t frames = 0;
    std::vector<float> samples;   // Interleaved: [L, R, L, R, ...]
    std::string sourceName;

    /// Mono RMS overview, one value per kPreviewWindowSeconds of audio
    std::vector<float> preview;
    static constexpr double kPreviewWindowSeconds = 0.02;

    double durationSeconds() const {
        return sampleRate > 0.0 ? static_cast<double>(frames) / sampleRate : 0.0;
    }

    /// Copy up to frameCount interleaved frames starting at startFrame into dest.
    /// Reads past the end return the available remainder (possibly 0).
    int64_t read(int64_t startFrame, int64_t frameCount, float* dest) const;

    /// Deinterleave frameCount frames into per-channel buffers.
    /// Frames outside [0, frames) are written as silence.
    /// Returns the number of frames that came from the asset.
    int readPlanar(int64_t startFrame, int frameCount, float* const* dest) const;

    /// Reduce the preview to at most `buckets` values (peak RMS per bucket)
    std::vector<float> previewBuckets(int buckets) const;

    /// Build an asset from interleaved PCM, computing frame count and preview.
    /// Trailing samples that do not fill a whole frame are dropped.
    static std::shared_ptr<const AudioAsset> fromInterleaved(std::vector<float> interleaved,
                                                             int channels,
                                                             double sampleRate,
                                                             std::string sourceName = {});
};

/// Owns the currently loaded asset.
///
/// The control thread swaps the whole asset with publish(); readers take a
/// reference with acquire() and keep it for as long as they read from it, so
/// an asset is never freed under an in-flight read.
class SampleStore {
public:
    SampleStore() = default;

    SampleStore(const SampleStore&) = delete;
    SampleStore& operator=(const SampleStore&) = delete;

    /// Replace the current asset (nullptr unloads)
    void publish(std::shared_ptr<const AudioAsset> asset);

    void unload() { publish(nullptr); }

    /// Take a reference to the current asset (may be null)
    std::shared_ptr<const AudioAsset> acquire() const;

    bool hasAsset() const { return acquire() != nullptr; }

    /// Incremented on every publish
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

private:
    std::shared_ptr<const AudioAsset> asset_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace loopah
