#pragma once

#include "core/PlaybackTypes.h"
#include "core/SampleStore.h"

#include <memory>
#include <string>

namespace loopah {

/// Outcome of decoding one file
struct DecodeResult {
    std::shared_ptr<const AudioAsset> asset;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None && asset != nullptr; }

    static DecodeResult failure(std::string message) {
        DecodeResult r;
        r.error = ErrorKind::DecodeError;
        r.message = std::move(message);
        return r;
    }
};

/// Turns a file into flat float PCM. Any implementation honouring this
/// contract can be plugged into the PlayerEngine.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    /// Decode the whole file. Never throws; failures come back as DecodeError.
    virtual DecodeResult decode(const std::string& path) = 0;
};

/// Decoder backed by juce::AudioFormatManager (WAV, AIFF, FLAC, Ogg Vorbis
/// and MP3 where the JUCE build enables them).
class JuceAudioDecoder : public AudioDecoder {
public:
    JuceAudioDecoder();
    ~JuceAudioDecoder() override;

    DecodeResult decode(const std::string& path) override;

    /// Largest channel count accepted
    static constexpr int kMaxChannels = 8;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loopah
