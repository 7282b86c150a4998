#include "core/PlaybackTypes.h"

#include <algorithm>
#include <cmath>

namespace loopah {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::DecodeError:       return "Decode Error";
        case ErrorKind::UnsupportedSpeed:  return "Unsupported Speed";
        case ErrorKind::InvalidLoopRegion: return "Invalid Loop Region";
        case ErrorKind::NoAsset:           return "No Audio Loaded";
        case ErrorKind::CommandQueueFull:  return "Command Queue Full";
        case ErrorKind::RenderFailure:     return "Render Failure";
    }
    return "Unknown";
}

std::string transportStateName(TransportState state) {
    switch (state) {
        case TransportState::Stopped: return "STOPPED";
        case TransportState::Playing: return "PLAYING";
        case TransportState::Paused:  return "PAUSED";
    }
    return "UNKNOWN";
}

int transportStateToInt(TransportState state) {
    switch (state) {
        case TransportState::Stopped: return 0;
        case TransportState::Playing: return 1;
        case TransportState::Paused:  return 2;
    }
    return 0;
}

TransportState intToTransportState(int v) {
    switch (v) {
        case 1: return TransportState::Playing;
        case 2: return TransportState::Paused;
    }
    return TransportState::Stopped;
}

double SpeedLimits::clamp(double ratio) const {
    if (!std::isfinite(ratio) || ratio <= 0.0) return minSpeed;
    return std::clamp(ratio, minSpeed, maxSpeed);
}

} // namespace loopah
