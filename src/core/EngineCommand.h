#pragma once

#include "core/PlaybackTypes.h"
#include "core/SpscQueue.h"

#include <cstdint>
#include <functional>
#include <string>

namespace loopah {

/// Command types for the control -> render SPSC queue
enum class CommandType {
    Play,
    Pause,
    Stop,
    Seek,            // position = target frame
    SetLoop,         // loop = new region
    SetLoopEnabled,  // loop.enabled = new flag, region retained
    SetSpeed,        // value = requested ratio (already clamped)
    AssetChanged     // Sample store was republished; pick up the new asset
};

/// Human-readable description for a CommandType
std::string commandTypeDescription(CommandType type);

/// Command sent from the control thread to the render thread.
/// Applied between render cycles, never in the middle of a block.
struct EngineCommand {
    CommandType commandType = CommandType::Play;
    double position = 0.0;
    double value = 0.0;
    LoopRegion loop;
};

/// Control -> render command channel
using CommandQueue = SpscQueue<EngineCommand, 256>;

/// Callbacks for engine state changes (used by the TUI and the OSC server).
/// May be invoked from the render thread.
struct EngineCallbacks {
    std::function<void()> onStateChanged;
    std::function<void(const std::string&)> onMessage;
};

} // namespace loopah
