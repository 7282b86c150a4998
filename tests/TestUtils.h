#pragma once

#include "core/AudioDecoder.h"
#include "core/SampleStore.h"

#include <juce_core/juce_core.h>

#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace TestUtils
{

constexpr double kTwoPi = 6.283185307179586;

// Interleaved sine, same signal on every channel
inline std::vector<float> sine(double frequency, double sampleRate, int64_t frames,
                               int channels = 1, float amplitude = 0.5f)
{
    std::vector<float> out(static_cast<size_t>(frames * channels));
    for (int64_t i = 0; i < frames; ++i)
    {
        float s = amplitude * static_cast<float>(std::sin(kTwoPi * frequency * static_cast<double>(i) / sampleRate));
        for (int ch = 0; ch < channels; ++ch)
            out[static_cast<size_t>(i * channels + ch)] = s;
    }
    return out;
}

// Mono ramp where sample i holds i * scale, for position checks
inline std::vector<float> ramp(int64_t frames, float scale = 1.0f)
{
    std::vector<float> out(static_cast<size_t>(frames));
    for (int64_t i = 0; i < frames; ++i)
        out[static_cast<size_t>(i)] = static_cast<float>(i) * scale;
    return out;
}

inline std::shared_ptr<const loopah::AudioAsset> sineAsset(double frequency, double sampleRate,
                                                           double seconds, int channels = 1)
{
    auto frames = static_cast<int64_t>(seconds * sampleRate);
    return loopah::AudioAsset::fromInterleaved(sine(frequency, sampleRate, frames, channels),
                                               channels, sampleRate, "sine.wav");
}

// Frequency estimate from positive-going zero crossings
inline double estimateFrequency(const float* samples, int count, double sampleRate)
{
    int first = -1, last = -1, crossings = 0;
    for (int i = 1; i < count; ++i)
    {
        if (samples[i - 1] < 0.0f && samples[i] >= 0.0f)
        {
            if (first < 0) first = i;
            else ++crossings;
            last = i;
        }
    }
    if (crossings < 1) return 0.0;
    return crossings * sampleRate / static_cast<double>(last - first);
}

inline float rms(const float* samples, int count)
{
    if (count <= 0) return 0.0f;
    double sum = 0.0;
    for (int i = 0; i < count; ++i)
        sum += static_cast<double>(samples[i]) * samples[i];
    return static_cast<float>(std::sqrt(sum / count));
}

// Decoder that serves prepared assets by path, failing for anything else
class FakeDecoder : public loopah::AudioDecoder
{
public:
    void add(const std::string& path, std::shared_ptr<const loopah::AudioAsset> asset)
    {
        m_assets[path] = std::move(asset);
    }

    loopah::DecodeResult decode(const std::string& path) override
    {
        ++decodeCount;
        auto it = m_assets.find(path);
        if (it == m_assets.end())
            return loopah::DecodeResult::failure("Cannot open " + path);
        loopah::DecodeResult result;
        result.asset = it->second;
        return result;
    }

    int decodeCount = 0;

private:
    std::map<std::string, std::shared_ptr<const loopah::AudioAsset>> m_assets;
};

// Run a suite and turn failures into the process exit code
inline int runSuite(juce::UnitTest& test)
{
    juce::UnitTestRunner runner;
    runner.setAssertOnFailure(false);
    runner.runTests({ &test });

    int failures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i)
        failures += runner.getResult(i)->failures;
    return failures > 0 ? 1 : 0;
}

} // namespace TestUtils
