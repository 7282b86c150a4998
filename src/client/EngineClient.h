#pragma once

#include "core/PlaybackTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace loopah {

/// Player state for display, updated once per TUI frame.
/// Times are in seconds so local and remote engines look the same.
struct PlayerSnapshot {
    TransportState state = TransportState::Stopped;
    double positionSeconds = 0.0;
    double durationSeconds = 0.0;
    double speed = 1.0;

    double loopStartSeconds = 0.0;
    double loopEndSeconds = 0.0;
    bool loopEnabled = false;
    bool hasLoop = false;       // A region has been set (enabled or not)

    std::string sourceName;     // Empty when nothing is loaded
    int channels = 0;
    double sampleRate = 0.0;
    int64_t totalFrames = 0;

    /// Overview of the loaded asset (RMS per bucket, 0..1)
    std::vector<float> preview;

    int64_t underrunCount = 0;
    bool underrunWarning = false;
    std::string lastError;      // Empty when no error is latched

    /// Messages received since last poll
    std::vector<std::string> messages;

    bool hasAsset() const { return totalFrames > 0; }
    bool isPlaying() const { return state == TransportState::Playing; }
};

/// Abstract interface for controlling the player engine.
/// The TUI uses this instead of PlayerEngine& directly.
class EngineClient {
public:
    virtual ~EngineClient() = default;

    // --- Commands ---
    virtual void load(const std::string& path) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void togglePlay() = 0;
    virtual void seekSeconds(double seconds) = 0;
    virtual void setLoopSeconds(double startSeconds, double endSeconds, bool enabled) = 0;
    virtual void setLoopEnabled(bool enabled) = 0;
    virtual void setSpeed(double ratio) = 0;
    virtual void clearError() = 0;

    // --- State ---
    virtual const PlayerSnapshot& snapshot() const = 0;

    /// Update the snapshot from the engine. Called once per TUI frame.
    virtual void poll() = 0;
};

} // namespace loopah
