#pragma once

#include <cstdint>
#include <string>

namespace loopah {

/// Transport state machine states
enum class TransportState {
    Stopped,
    Playing,
    Paused
};

/// Error kinds surfaced by the Command API and the Status API
enum class ErrorKind {
    None,
    DecodeError,        // Source file unreadable or unsupported
    UnsupportedSpeed,   // Speed outside the stretcher's range (clamped, not surfaced)
    InvalidLoopRegion,  // start >= end or out of asset bounds
    NoAsset,            // Command needs a loaded asset
    CommandQueueFull,   // Render thread is not draining commands
    RenderFailure       // Latched by the render thread
};

/// Human-readable names (for logs, TUI and OSC pushes)
std::string errorKindName(ErrorKind kind);
std::string transportStateName(TransportState state);

/// Integer encodings used on the OSC wire
int transportStateToInt(TransportState state);
TransportState intToTransportState(int v);

/// A/B loop region in source frames, half-open [startFrame, endFrame)
struct LoopRegion {
    int64_t startFrame = 0;
    int64_t endFrame = 0;
    bool enabled = false;

    int64_t length() const { return endFrame - startFrame; }
    bool isValid() const { return startFrame >= 0 && startFrame < endFrame; }
    bool contains(double frame) const {
        return frame >= static_cast<double>(startFrame) &&
               frame < static_cast<double>(endFrame);
    }

    bool operator==(const LoopRegion& other) const {
        return startFrame == other.startFrame && endFrame == other.endFrame &&
               enabled == other.enabled;
    }
    bool operator!=(const LoopRegion& other) const { return !(*this == other); }
};

/// Valid playback speed range. Requests outside it are clamped.
struct SpeedLimits {
    double minSpeed = 0.125;
    double maxSpeed = 2.0;

    /// Clamp a requested ratio into range. NaN and non-positive values map to minSpeed.
    double clamp(double ratio) const;
    bool contains(double ratio) const { return ratio >= minSpeed && ratio <= maxSpeed; }
};

/// Immediate result of a Command API call. Application is asynchronous;
/// only validation failures are reported here.
struct CommandResult {
    ErrorKind error = ErrorKind::None;
    std::string message;
    double value = 0.0;  // Applied value where meaningful (e.g. clamped speed)

    bool ok() const { return error == ErrorKind::None; }

    static CommandResult success(double value = 0.0) {
        CommandResult r;
        r.value = value;
        return r;
    }
    static CommandResult failure(ErrorKind kind, std::string message) {
        CommandResult r;
        r.error = kind;
        r.message = std::move(message);
        return r;
    }
};

} // namespace loopah
