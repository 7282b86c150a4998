#include "core/AudioDecoder.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <algorithm>
#include <new>
#include <vector>

namespace loopah {

struct JuceAudioDecoder::Impl {
    juce::AudioFormatManager formats;
};

JuceAudioDecoder::JuceAudioDecoder() : impl_(std::make_unique<Impl>()) {
    impl_->formats.registerBasicFormats();
}

JuceAudioDecoder::~JuceAudioDecoder() = default;

DecodeResult JuceAudioDecoder::decode(const std::string& path) {
    if (path.empty()) {
        return DecodeResult::failure("No file given");
    }

    juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile()) {
        return DecodeResult::failure("File not found: " + path);
    }

    std::unique_ptr<juce::AudioFormatReader> reader(impl_->formats.createReaderFor(file));
    if (reader == nullptr) {
        return DecodeResult::failure("Unsupported or corrupt audio file: " + path);
    }

    const juce::int64 totalFrames = reader->lengthInSamples;
    const int channels = static_cast<int>(reader->numChannels);
    const double sampleRate = reader->sampleRate;

    if (totalFrames <= 0) {
        return DecodeResult::failure("Empty audio file: " + path);
    }
    if (channels < 1 || channels > kMaxChannels) {
        return DecodeResult::failure("Unsupported channel count (" +
                                     std::to_string(channels) + "): " + path);
    }
    if (sampleRate <= 0.0) {
        return DecodeResult::failure("Invalid sample rate: " + path);
    }

    std::vector<float> interleaved;
    try {
        interleaved.resize(static_cast<size_t>(totalFrames) * static_cast<size_t>(channels));
    } catch (const std::bad_alloc&) {
        return DecodeResult::failure("File too large to decode: " + path);
    }

    // Read in chunks so the planar scratch buffer stays small
    constexpr int kChunkFrames = 65536;
    juce::AudioBuffer<float> chunk(channels, kChunkFrames);
    juce::int64 position = 0;

    while (position < totalFrames) {
        const int toRead = static_cast<int>(
            std::min<juce::int64>(kChunkFrames, totalFrames - position));
        if (!reader->read(&chunk, 0, toRead, position, true, true)) {
            return DecodeResult::failure("Failed to read audio data: " + path);
        }

        float* dest = interleaved.data() + static_cast<size_t>(position) * static_cast<size_t>(channels);
        for (int ch = 0; ch < channels; ++ch) {
            const float* src = chunk.getReadPointer(ch);
            for (int i = 0; i < toRead; ++i) {
                dest[i * channels + ch] = src[i];
            }
        }
        position += toRead;
    }

    DecodeResult result;
    result.asset = AudioAsset::fromInterleaved(std::move(interleaved), channels, sampleRate,
                                               file.getFileName().toStdString());
    return result;
}

} // namespace loopah
