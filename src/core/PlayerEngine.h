#pragma once

#include "core/AudioDecoder.h"
#include "core/EngineCommand.h"
#include "core/OutputQueue.h"
#include "core/Renderer.h"
#include "core/SampleStore.h"
#include "core/TimeStretcher.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace loopah {

/// Engine construction settings (usually filled from Config)
struct EngineSettings {
    double deviceSampleRate = 48000.0;
    int blockFrames = 512;
    int queueBlocks = 8;
    SpeedLimits speedLimits;
    double defaultSpeed = 1.0;
    double speedResetThreshold = 0.5;     // Relative speed jump that resets the stretcher
    StretchPreset preset = StretchPreset::Cheaper;
    double underrunWarnPerSec = 2.0;
};

/// Polled snapshot for the Status API
struct EngineStatus {
    TransportState state = TransportState::Stopped;
    double positionFrames = 0.0;
    double positionSeconds = 0.0;
    double speed = 1.0;
    LoopRegion loop;

    int64_t totalFrames = 0;
    double durationSeconds = 0.0;
    double sampleRate = 0.0;
    int channels = 0;
    std::string sourceName;

    int64_t underrunCount = 0;
    bool underrunWarning = false;   // Underrun rate above the configured threshold
    int bufferedFrames = 0;
    int64_t loopCount = 0;

    ErrorKind lastError = ErrorKind::None;
    std::string lastErrorMessage;

    bool hasAsset() const { return totalFrames > 0; }
};

/// Facade over the playback pipeline: Sample Store, Transport (inside the
/// Renderer), TimeStretcher, OutputQueue and the command channel.
///
/// Command API calls validate, enqueue and return immediately; the render
/// thread applies them between blocks. Any number of control threads may call
/// the Command API (calls are serialized so the channel keeps one producer).
/// renderOutput() is the only entry point for the real-time thread.
class PlayerEngine {
public:
    /// @param decoder Decoder used by load(); nullptr selects JuceAudioDecoder
    explicit PlayerEngine(EngineSettings settings = {},
                          std::unique_ptr<AudioDecoder> decoder = nullptr);
    ~PlayerEngine();

    PlayerEngine(const PlayerEngine&) = delete;
    PlayerEngine& operator=(const PlayerEngine&) = delete;

    // --- Command API ---

    /// Decode a file (on the calling thread) and make it the current asset.
    /// On DecodeError the previous asset stays loaded.
    CommandResult load(const std::string& path);

    /// Install already decoded audio
    CommandResult loadAsset(std::shared_ptr<const AudioAsset> asset);

    CommandResult unload();

    CommandResult play();
    CommandResult pause();
    CommandResult stop();
    CommandResult togglePlay();

    CommandResult seekFrames(double frame);
    CommandResult seekSeconds(double seconds);

    /// Loop region in source frames, half-open [start, end).
    /// Fails with InvalidLoopRegion if start >= end, start < 0 or
    /// end > total frames; the previous region is kept.
    CommandResult setLoopFrames(int64_t startFrame, int64_t endFrame, bool enabled = true);

    /// Seconds variant: start rounds down, end rounds up to whole frames
    CommandResult setLoopSeconds(double startSeconds, double endSeconds, bool enabled = true);

    /// Enable or disable looping of the retained region
    CommandResult setLoopEnabled(bool enabled);

    /// Last accepted loop region
    LoopRegion loop() const;

    /// Speed is clamped to the configured limits, never rejected.
    /// result.value holds the applied speed.
    CommandResult setSpeed(double ratio);
    CommandResult nudgeSpeed(double delta);

    /// Speed most recently requested (clamped)
    double requestedSpeed() const;

    // --- Status API ---

    EngineStatus status() const;

    /// The asset currently published to the sample store (may be null)
    std::shared_ptr<const AudioAsset> currentAsset() const { return store_.acquire(); }

    /// Changes whenever a different asset is published
    uint64_t assetGeneration() const { return store_.generation(); }

    /// Clear the latched error
    void clearError();

    // --- Output callback (real-time thread) ---

    /// Fill numFrames of device output. Never blocks or allocates.
    /// Returns the frames that came from rendered audio (the rest is silence).
    int renderOutput(float* const* outputs, int numOutputChannels, int numFrames);

    // --- Render thread ---

    void startRendering();
    void stopRendering();
    bool isRendering() const { return renderer_.isRunning(); }

    /// Run one render cycle on the calling thread (only while not rendering).
    /// Returns the number of blocks pushed.
    int renderCycle() { return renderer_.renderCycle(); }

    /// Set callbacks before startRendering()
    void setCallbacks(EngineCallbacks cb);

    const EngineSettings& settings() const { return settings_; }

private:
    /// Enqueue a command. Caller holds controlMutex_.
    CommandResult send(const EngineCommand& cmd);

    /// Record a control-side failure and return it
    CommandResult reject(ErrorKind kind, std::string message);

    CommandResult installAsset(std::shared_ptr<const AudioAsset> asset);

    void postMessage(const std::string& msg);

    EngineSettings settings_;
    std::unique_ptr<AudioDecoder> decoder_;

    SampleStore store_;
    OutputQueue outputQueue_;
    CommandQueue commands_;
    Renderer renderer_;

    EngineCallbacks callbacks_;

    // Control-side view, guarded by controlMutex_
    mutable std::mutex controlMutex_;
    std::shared_ptr<const AudioAsset> asset_;
    LoopRegion loop_;
    double speed_ = 1.0;
    ErrorKind controlError_ = ErrorKind::None;
    std::string controlErrorMessage_;

    // Underrun rate tracking for status()
    mutable std::mutex underrunMutex_;
    mutable std::chrono::steady_clock::time_point underrunWindowStart_;
    mutable int64_t underrunWindowCount_ = 0;
    mutable bool underrunWarning_ = false;
};

} // namespace loopah
