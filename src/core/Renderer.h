#pragma once

#include "core/EngineCommand.h"
#include "core/OutputQueue.h"
#include "core/SampleStore.h"
#include "core/TimeStretcher.h"
#include "core/Transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace loopah {

/// Render-side settings, fixed for the renderer's lifetime
struct RendererSettings {
    double deviceSampleRate = 48000.0;
    SpeedLimits speedLimits;
    double speedResetThreshold = 0.5;
    StretchPreset preset = StretchPreset::Cheaper;
};

/// Snapshot of render-thread state, published after every cycle
struct RenderStatus {
    TransportState state = TransportState::Stopped;
    double positionFrames = 0.0;
    double speed = 1.0;
    LoopRegion loop;
    int64_t totalFrames = 0;
    double assetSampleRate = 0.0;
    int channels = 0;
    std::string sourceName;
    int64_t wrapCount = 0;

    ErrorKind lastError = ErrorKind::None;
    std::string lastErrorMessage;
};

/// Producer side of the playback pipeline.
///
/// Each cycle drains the command channel into the Transport, then renders
/// blocks through the TimeStretcher into the OutputQueue until it is full.
/// Runs on its own thread (start/stop) or is driven synchronously with
/// renderCycle() in tests and offline use.
class Renderer {
public:
    Renderer(SampleStore& store, OutputQueue& queue, CommandQueue& commands,
             RendererSettings settings);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    void setCallbacks(EngineCallbacks cb) { callbacks_ = std::move(cb); }

    /// Apply pending commands and render as many blocks as fit.
    /// Must not run concurrently with the render thread.
    /// Returns the number of blocks pushed.
    int renderCycle();

    /// Start / stop the render thread
    void start();
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /// Wake the render thread early (after enqueueing a command)
    void wake();

    RenderStatus status() const;
    void clearError();

private:
    void threadMain();

    void drainCommands();
    void applyCommand(const EngineCommand& cmd);

    /// Pick up the asset currently in the store
    void attachAsset();

    /// Render one block into the queue. Returns false if the queue was full.
    bool renderBlock();

    /// Reset the stretcher and fill its history from sourceFrame onwards
    void primeStretcher(int64_t sourceFrame, double step);

    /// Playback cannot continue: stop and latch the error
    void fail(ErrorKind kind, const std::string& message);

    void publishStatus();
    void postMessage(const std::string& msg);

    SampleStore& store_;
    OutputQueue& queue_;
    CommandQueue& commands_;
    RendererSettings settings_;
    EngineCallbacks callbacks_;

    // Render-thread state
    Transport transport_;
    TimeStretcher stretcher_;
    std::shared_ptr<const AudioAsset> asset_;   // Held for the whole cycle
    RenderPlan plan_;
    std::vector<std::vector<float>> inputBuffers_;
    std::vector<std::vector<float>> outputBuffers_;
    std::vector<float*> inputPtrs_;
    std::vector<float*> outputPtrs_;
    int inputCapacity_ = 0;
    std::vector<std::vector<float>> primeBuffers_;
    std::vector<std::vector<float>> scratchBuffers_;
    std::vector<float*> primePtrs_;
    std::vector<float*> scratchPtrs_;
    int64_t feedPosition_ = 0;   // Next source frame fed to the stretcher

    // Status (render thread -> control side)
    mutable std::mutex statusMutex_;
    RenderStatus status_;

    // Thread
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool wakePending_ = false;
    std::chrono::microseconds idleWait_{5000};
};

} // namespace loopah
