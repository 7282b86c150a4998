#include "core/PlayerEngine.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace loopah {

namespace {

EngineSettings sanitize(EngineSettings s) {
    if (!(s.deviceSampleRate > 0.0)) s.deviceSampleRate = 48000.0;
    s.blockFrames = std::clamp(s.blockFrames, 64, 4096);
    s.queueBlocks = std::clamp(s.queueBlocks, 2, 64);

    SpeedLimits& lim = s.speedLimits;
    lim.minSpeed = std::clamp(lim.minSpeed, TimeStretcher::kMinSpeed, 1.0);
    lim.maxSpeed = std::clamp(lim.maxSpeed, 1.0, TimeStretcher::kMaxSpeed);
    s.defaultSpeed = lim.clamp(s.defaultSpeed);
    if (!(s.speedResetThreshold >= 0.0)) s.speedResetThreshold = 0.5;
    return s;
}

RendererSettings rendererSettings(const EngineSettings& s) {
    RendererSettings r;
    r.deviceSampleRate = s.deviceSampleRate;
    r.speedLimits = s.speedLimits;
    r.speedResetThreshold = s.speedResetThreshold;
    r.preset = s.preset;
    return r;
}

} // namespace

PlayerEngine::PlayerEngine(EngineSettings settings, std::unique_ptr<AudioDecoder> decoder)
    : settings_(sanitize(settings))
    , decoder_(std::move(decoder))
    , outputQueue_(settings_.blockFrames, settings_.queueBlocks, TimeStretcher::kMaxChannels)
    , renderer_(store_, outputQueue_, commands_, rendererSettings(settings_))
    , underrunWindowStart_(std::chrono::steady_clock::now())
{
    if (!decoder_) decoder_ = std::make_unique<JuceAudioDecoder>();

    speed_ = settings_.defaultSpeed;
    EngineCommand cmd;
    cmd.commandType = CommandType::SetSpeed;
    cmd.value = speed_;
    commands_.push(cmd);
}

PlayerEngine::~PlayerEngine() {
    renderer_.stop();
}

// --- Command API ---

CommandResult PlayerEngine::load(const std::string& path) {
    // Decoding can take a while; keep other commands flowing meanwhile
    DecodeResult decoded = decoder_->decode(path);
    if (!decoded.ok()) {
        fprintf(stderr, "Loopah: %s\n", decoded.message.c_str());
        std::lock_guard<std::mutex> lock(controlMutex_);
        return reject(ErrorKind::DecodeError, decoded.message);
    }
    return loadAsset(std::move(decoded.asset));
}

CommandResult PlayerEngine::loadAsset(std::shared_ptr<const AudioAsset> asset) {
    if (!asset || asset->frames <= 0 || asset->channels <= 0) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        return reject(ErrorKind::DecodeError, "Audio contains no frames");
    }

    CommandResult result;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        result = installAsset(asset);
    }
    if (result.ok()) {
        char buf[256];
        snprintf(buf, sizeof(buf), "Loaded %s (%d ch, %.0f Hz, %.1f s)",
                 asset->sourceName.c_str(), asset->channels, asset->sampleRate,
                 asset->durationSeconds());
        postMessage(buf);
    }
    return result;
}

CommandResult PlayerEngine::unload() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return installAsset(nullptr);
}

CommandResult PlayerEngine::installAsset(std::shared_ptr<const AudioAsset> asset) {
    // Publishing without the AssetChanged command would desync the renderer
    if (commands_.size() >= CommandQueue::capacity()) {
        return reject(ErrorKind::CommandQueueFull, "Command queue full, load dropped");
    }

    store_.publish(asset);
    asset_ = std::move(asset);
    loop_ = LoopRegion{};

    EngineCommand cmd;
    cmd.commandType = CommandType::AssetChanged;
    return send(cmd);
}

CommandResult PlayerEngine::play() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!asset_) return reject(ErrorKind::NoAsset, "Nothing loaded");

    EngineCommand cmd;
    cmd.commandType = CommandType::Play;
    return send(cmd);
}

CommandResult PlayerEngine::pause() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    EngineCommand cmd;
    cmd.commandType = CommandType::Pause;
    return send(cmd);
}

CommandResult PlayerEngine::stop() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    EngineCommand cmd;
    cmd.commandType = CommandType::Stop;
    return send(cmd);
}

CommandResult PlayerEngine::togglePlay() {
    if (renderer_.status().state == TransportState::Playing) {
        return pause();
    }
    return play();
}

CommandResult PlayerEngine::seekFrames(double frame) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!asset_) return reject(ErrorKind::NoAsset, "Nothing loaded");
    if (!std::isfinite(frame)) frame = 0.0;

    EngineCommand cmd;
    cmd.commandType = CommandType::Seek;
    cmd.position = std::clamp(frame, 0.0, static_cast<double>(asset_->frames - 1));
    CommandResult result = send(cmd);
    result.value = cmd.position;
    return result;
}

CommandResult PlayerEngine::seekSeconds(double seconds) {
    double sampleRate = 0.0;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!asset_) return reject(ErrorKind::NoAsset, "Nothing loaded");
        sampleRate = asset_->sampleRate;
    }
    return seekFrames(seconds * sampleRate);
}

CommandResult PlayerEngine::setLoopFrames(int64_t startFrame, int64_t endFrame, bool enabled) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!asset_) return reject(ErrorKind::NoAsset, "Nothing loaded");

    if (startFrame < 0 || startFrame >= endFrame || endFrame > asset_->frames) {
        return reject(ErrorKind::InvalidLoopRegion,
                      "Invalid loop region [" + std::to_string(startFrame) + ", " +
                      std::to_string(endFrame) + ") for " +
                      std::to_string(asset_->frames) + " frames");
    }

    LoopRegion region;
    region.startFrame = startFrame;
    region.endFrame = endFrame;
    region.enabled = enabled;

    EngineCommand cmd;
    cmd.commandType = CommandType::SetLoop;
    cmd.loop = region;
    CommandResult result = send(cmd);
    if (result.ok()) loop_ = region;
    return result;
}

CommandResult PlayerEngine::setLoopSeconds(double startSeconds, double endSeconds, bool enabled) {
    double sampleRate = 0.0;
    int64_t totalFrames = 0;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!asset_) return reject(ErrorKind::NoAsset, "Nothing loaded");
        sampleRate = asset_->sampleRate;
        totalFrames = asset_->frames;
    }
    if (!std::isfinite(startSeconds) || !std::isfinite(endSeconds)) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        return reject(ErrorKind::InvalidLoopRegion, "Loop points must be finite");
    }

    auto start = static_cast<int64_t>(std::floor(startSeconds * sampleRate));
    auto end = static_cast<int64_t>(std::ceil(endSeconds * sampleRate));
    // Less than one frame past the end is rounding, not an out of range request
    if (end == totalFrames + 1) end = totalFrames;
    return setLoopFrames(start, end, enabled);
}

CommandResult PlayerEngine::setLoopEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (enabled && !loop_.isValid()) {
        return reject(ErrorKind::InvalidLoopRegion, "No loop region set");
    }

    EngineCommand cmd;
    cmd.commandType = CommandType::SetLoopEnabled;
    cmd.loop = loop_;
    cmd.loop.enabled = enabled;
    CommandResult result = send(cmd);
    if (result.ok()) loop_.enabled = enabled;
    return result;
}

LoopRegion PlayerEngine::loop() const {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return loop_;
}

CommandResult PlayerEngine::setSpeed(double ratio) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    const double applied = settings_.speedLimits.clamp(ratio);

    EngineCommand cmd;
    cmd.commandType = CommandType::SetSpeed;
    cmd.value = applied;
    CommandResult result = send(cmd);
    if (result.ok()) speed_ = applied;
    result.value = applied;
    return result;
}

CommandResult PlayerEngine::nudgeSpeed(double delta) {
    return setSpeed(requestedSpeed() + delta);
}

double PlayerEngine::requestedSpeed() const {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return speed_;
}

// --- Status API ---

EngineStatus PlayerEngine::status() const {
    RenderStatus rs = renderer_.status();

    EngineStatus st;
    st.state = rs.state;
    st.positionFrames = (rs.state == TransportState::Playing) ? outputQueue_.playhead()
                                                              : rs.positionFrames;
    st.speed = rs.speed;
    st.loop = rs.loop;
    st.totalFrames = rs.totalFrames;
    st.sampleRate = rs.assetSampleRate;
    st.channels = rs.channels;
    st.sourceName = rs.sourceName;
    st.loopCount = rs.wrapCount;
    st.bufferedFrames = outputQueue_.bufferedFrames();
    if (st.sampleRate > 0.0) {
        st.positionSeconds = st.positionFrames / st.sampleRate;
        st.durationSeconds = static_cast<double>(st.totalFrames) / st.sampleRate;
    }

    st.underrunCount = outputQueue_.underrunCount();
    {
        std::lock_guard<std::mutex> lock(underrunMutex_);
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - underrunWindowStart_).count();
        if (elapsed >= 1.0) {
            double rate = static_cast<double>(st.underrunCount - underrunWindowCount_) / elapsed;
            underrunWarning_ = rate > settings_.underrunWarnPerSec;
            underrunWindowStart_ = now;
            underrunWindowCount_ = st.underrunCount;
        }
        st.underrunWarning = underrunWarning_;
    }

    if (rs.lastError != ErrorKind::None) {
        st.lastError = rs.lastError;
        st.lastErrorMessage = rs.lastErrorMessage;
    } else {
        std::lock_guard<std::mutex> lock(controlMutex_);
        st.lastError = controlError_;
        st.lastErrorMessage = controlErrorMessage_;
    }
    return st;
}

void PlayerEngine::clearError() {
    renderer_.clearError();
    std::lock_guard<std::mutex> lock(controlMutex_);
    controlError_ = ErrorKind::None;
    controlErrorMessage_.clear();
}

// --- Output callback ---

int PlayerEngine::renderOutput(float* const* outputs, int numOutputChannels, int numFrames) {
    return outputQueue_.read(outputs, numOutputChannels, numFrames);
}

// --- Render thread ---

void PlayerEngine::startRendering() {
    renderer_.start();
}

void PlayerEngine::stopRendering() {
    renderer_.stop();
}

void PlayerEngine::setCallbacks(EngineCallbacks cb) {
    callbacks_ = cb;
    renderer_.setCallbacks(std::move(cb));
}

// --- Private ---

CommandResult PlayerEngine::send(const EngineCommand& cmd) {
    if (!commands_.push(cmd)) {
        return reject(ErrorKind::CommandQueueFull,
                      commandTypeDescription(cmd.commandType) + " dropped, command queue full");
    }
    renderer_.wake();
    return CommandResult::success();
}

CommandResult PlayerEngine::reject(ErrorKind kind, std::string message) {
    controlError_ = kind;
    controlErrorMessage_ = message;
    return CommandResult::failure(kind, std::move(message));
}

void PlayerEngine::postMessage(const std::string& msg) {
    if (callbacks_.onMessage) callbacks_.onMessage(msg);
}

} // namespace loopah
