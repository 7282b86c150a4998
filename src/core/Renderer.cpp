#include "core/Renderer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace loopah {

std::string commandTypeDescription(CommandType type) {
    switch (type) {
        case CommandType::Play:           return "Play";
        case CommandType::Pause:          return "Pause";
        case CommandType::Stop:           return "Stop";
        case CommandType::Seek:           return "Seek";
        case CommandType::SetLoop:        return "Set Loop";
        case CommandType::SetLoopEnabled: return "Set Loop Enabled";
        case CommandType::SetSpeed:       return "Set Speed";
        case CommandType::AssetChanged:   return "Asset Changed";
    }
    return "Unknown";
}

Renderer::Renderer(SampleStore& store, OutputQueue& queue, CommandQueue& commands,
                   RendererSettings settings)
    : store_(store)
    , queue_(queue)
    , commands_(commands)
    , settings_(settings)
{
    if (!(settings_.deviceSampleRate > 0.0)) settings_.deviceSampleRate = 48000.0;

    transport_.setSpeedLimits(settings_.speedLimits);
    transport_.setSpeedResetThreshold(settings_.speedResetThreshold);

    const int channels = std::min(queue_.maxChannels(), TimeStretcher::kMaxChannels);
    outputBuffers_.assign(static_cast<size_t>(channels),
                          std::vector<float>(static_cast<size_t>(queue_.blockFrames()), 0.0f));

    // Half a block period between polls of a full queue
    double blockSeconds = queue_.blockFrames() / settings_.deviceSampleRate;
    idleWait_ = std::chrono::microseconds(
        std::max<int64_t>(500, static_cast<int64_t>(blockSeconds * 0.5e6)));
}

Renderer::~Renderer() {
    stop();
}

int Renderer::renderCycle() {
    drainCommands();
    if (transport_.consumeFlushRequest()) {
        queue_.flush();
        queue_.setPlayhead(transport_.position());
    }

    int pushed = 0;
    while (transport_.isPlaying() && renderBlock()) {
        ++pushed;
    }

    // A failure inside the loop stops the transport
    if (transport_.consumeFlushRequest()) {
        queue_.flush();
        queue_.setPlayhead(transport_.position());
    }
    queue_.setExpectingAudio(transport_.isPlaying());

    publishStatus();
    return pushed;
}

void Renderer::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&Renderer::threadMain, this);
}

void Renderer::stop() {
    if (!running_.exchange(false)) return;
    wake();
    if (thread_.joinable()) thread_.join();
}

void Renderer::wake() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakePending_ = true;
    }
    wakeCv_.notify_one();
}

RenderStatus Renderer::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void Renderer::clearError() {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.lastError = ErrorKind::None;
    status_.lastErrorMessage.clear();
}

void Renderer::threadMain() {
    while (running_.load(std::memory_order_acquire)) {
        renderCycle();

        // The device callback never signals; a full queue is polled
        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, idleWait_, [this] {
            return wakePending_ || !running_.load(std::memory_order_acquire);
        });
        wakePending_ = false;
    }
}

void Renderer::drainCommands() {
    bool changed = false;
    EngineCommand cmd;
    while (commands_.pop(cmd)) {
        applyCommand(cmd);
        changed = true;
    }
    if (changed && callbacks_.onStateChanged) callbacks_.onStateChanged();
}

void Renderer::applyCommand(const EngineCommand& cmd) {
    switch (cmd.commandType) {
        case CommandType::Play:
            if (!transport_.isPlaying()) {
                transport_.play();
                queue_.setPlayhead(transport_.position());
            }
            break;

        case CommandType::Pause:
            if (transport_.isPlaying()) {
                // Resume from what was actually heard, not from what was rendered
                transport_.pause();
                transport_.seek(queue_.playhead());
            }
            break;

        case CommandType::Stop:
            transport_.stop();
            break;

        case CommandType::Seek:
            transport_.seek(cmd.position);
            break;

        case CommandType::SetLoop:
            if (!transport_.setLoop(cmd.loop)) {
                postMessage("Loop region does not fit the current asset, ignored");
            }
            break;

        case CommandType::SetLoopEnabled:
            transport_.setLoopEnabled(cmd.loop.enabled);
            break;

        case CommandType::SetSpeed:
            transport_.setSpeed(cmd.value);
            break;

        case CommandType::AssetChanged:
            attachAsset();
            break;
    }
}

void Renderer::attachAsset() {
    asset_ = store_.acquire();

    if (!asset_ || asset_->frames <= 0) {
        asset_.reset();
        transport_.setAsset(0);
        return;
    }

    if (asset_->channels < 1 || asset_->channels > static_cast<int>(outputBuffers_.size())) {
        std::string msg = "Unsupported channel layout: " +
                          std::to_string(asset_->channels) + " channels";
        asset_.reset();
        transport_.setAsset(0);
        fail(ErrorKind::RenderFailure, msg);
        return;
    }

    const int channels = asset_->channels;
    const double rateRatio = asset_->sampleRate / settings_.deviceSampleRate;

    stretcher_.configure(channels, asset_->sampleRate, settings_.preset);
    stretcher_.setRateCompensation(rateRatio);
    transport_.setAsset(asset_->frames, rateRatio);

    // Worst case source frames for one block, plus the fractional carry
    inputCapacity_ = static_cast<int>(std::ceil(
        queue_.blockFrames() * settings_.speedLimits.maxSpeed * rateRatio)) + 2;
    inputBuffers_.assign(static_cast<size_t>(channels),
                         std::vector<float>(static_cast<size_t>(inputCapacity_), 0.0f));
    inputPtrs_.resize(static_cast<size_t>(channels));
    outputPtrs_.resize(static_cast<size_t>(channels));
    for (int ch = 0; ch < channels; ++ch) {
        inputPtrs_[static_cast<size_t>(ch)] = inputBuffers_[static_cast<size_t>(ch)].data();
    }

    // Priming reads ahead by the stretcher latency at the fastest step
    const int primeCapacity = stretcher_.primeLength(settings_.speedLimits.maxSpeed * rateRatio) + 2;
    const int scratchFrames = std::max(stretcher_.outputLatency(), 1);
    primeBuffers_.assign(static_cast<size_t>(channels),
                         std::vector<float>(static_cast<size_t>(primeCapacity), 0.0f));
    scratchBuffers_.assign(static_cast<size_t>(channels),
                           std::vector<float>(static_cast<size_t>(scratchFrames), 0.0f));
    primePtrs_.resize(static_cast<size_t>(channels));
    scratchPtrs_.resize(static_cast<size_t>(channels));
    for (int ch = 0; ch < channels; ++ch) {
        primePtrs_[static_cast<size_t>(ch)] = primeBuffers_[static_cast<size_t>(ch)].data();
        scratchPtrs_[static_cast<size_t>(ch)] = scratchBuffers_[static_cast<size_t>(ch)].data();
    }
    feedPosition_ = 0;

    fprintf(stderr, "Loopah: render attached %s (%d ch, %.0f Hz, rate ratio %.4f)\n",
            asset_->sourceName.c_str(), channels, asset_->sampleRate, rateRatio);
}

bool Renderer::renderBlock() {
    OutputBlock* block = queue_.beginWrite();
    if (block == nullptr) return false;

    const int frames = queue_.blockFrames();

    if (!asset_ || !stretcher_.isConfigured()) {
        block->channels = 1;
        block->frames = frames;
        std::fill(block->samples.begin(), block->samples.begin() + frames, 0.0f);
        block->sourcePosition = transport_.position();
        block->sourceStep = 0.0;
        block->loopStart = block->loopEnd = 0;
        queue_.commitWrite();
        fail(ErrorKind::RenderFailure, "Playback requested with no audio to render");
        return false;
    }

    const int channels = asset_->channels;
    const double step = transport_.inputPerOutput();

    // Input runs ahead by the stretcher latency, so output lines up with the transport
    const double tag = transport_.position();

    const LoopRegion loop = transport_.loop();
    const bool looping = transport_.loopActive();

    int written = 0;
    while (written < frames && transport_.isPlaying()) {
        transport_.advance(frames - written, plan_);

        for (int s = 0; s < plan_.count; ++s) {
            const RenderSegment& seg = plan_.segments[static_cast<size_t>(s)];
            if (seg.sourceFrames > inputCapacity_) {
                fail(ErrorKind::RenderFailure, "Render segment exceeds the input buffer");
                return false;
            }
            if (seg.resetBefore) primeStretcher(seg.sourceStart, step);

            // Past the loop end this reads on into the file (silence past its end),
            // which drains the frames before the seam out of the stretcher
            asset_->readPlanar(feedPosition_, seg.sourceFrames, inputPtrs_.data());
            feedPosition_ += seg.sourceFrames;
            for (int ch = 0; ch < channels; ++ch) {
                outputPtrs_[static_cast<size_t>(ch)] =
                    outputBuffers_[static_cast<size_t>(ch)].data() + written;
            }
            stretcher_.process(inputPtrs_.data(), seg.sourceFrames,
                               outputPtrs_.data(), seg.outputFrames);
            written += seg.outputFrames;
        }

        if (plan_.reachedEnd) {
            postMessage("Stopped at end of file");
            break;
        }
        if (plan_.count == 0) break;
    }

    if (written <= 0) return false;

    block->channels = channels;
    block->frames = written;
    float* out = block->samples.data();
    for (int i = 0; i < written; ++i) {
        for (int ch = 0; ch < channels; ++ch) {
            out[i * channels + ch] = outputBuffers_[static_cast<size_t>(ch)][static_cast<size_t>(i)];
        }
    }
    block->sourcePosition = tag;
    block->sourceStep = step;
    block->loopStart = looping ? loop.startFrame : 0;
    block->loopEnd = looping ? loop.endFrame : 0;

    queue_.commitWrite();
    return true;
}

void Renderer::primeStretcher(int64_t sourceFrame, double step) {
    stretcher_.reset();
    const int length = stretcher_.primeLength(step);
    asset_->readPlanar(sourceFrame, length, primePtrs_.data());
    stretcher_.prime(primePtrs_.data(), step, scratchPtrs_.data());
    feedPosition_ = sourceFrame + length;
}

void Renderer::fail(ErrorKind kind, const std::string& message) {
    transport_.stop();
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.lastError = kind;
        status_.lastErrorMessage = message;
    }
    fprintf(stderr, "Loopah: %s: %s\n", errorKindName(kind).c_str(), message.c_str());
    postMessage(message);
}

void Renderer::publishStatus() {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.state = transport_.state();
    status_.positionFrames = transport_.position();
    status_.speed = transport_.speed();
    status_.loop = transport_.loop();
    status_.totalFrames = transport_.totalFrames();
    status_.wrapCount = transport_.wrapCount();
    if (asset_) {
        status_.assetSampleRate = asset_->sampleRate;
        status_.channels = asset_->channels;
        status_.sourceName = asset_->sourceName;
    } else {
        status_.assetSampleRate = 0.0;
        status_.channels = 0;
        status_.sourceName.clear();
    }
}

void Renderer::postMessage(const std::string& msg) {
    if (callbacks_.onMessage) callbacks_.onMessage(msg);
}

} // namespace loopah
