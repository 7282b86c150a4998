#include "client/LocalEngineClient.h"

namespace loopah {

namespace {
// Enough resolution for any terminal width
constexpr int kPreviewBuckets = 1024;
} // namespace

LocalEngineClient::LocalEngineClient(PlayerEngine& engine, EngineCallbacks forwardTo)
    : engine_(engine)
    , forward_(std::move(forwardTo))
{
    // Wire engine message callback to buffer messages for poll()
    EngineCallbacks callbacks;
    callbacks.onMessage = [this](const std::string& msg) {
        pushMessage(msg);
        if (forward_.onMessage) forward_.onMessage(msg);
    };
    callbacks.onStateChanged = [this]() {
        if (forward_.onStateChanged) forward_.onStateChanged();
    };
    engine_.setCallbacks(std::move(callbacks));
}

void LocalEngineClient::load(const std::string& path) {
    report(engine_.load(path));
}

void LocalEngineClient::play() {
    report(engine_.play());
}

void LocalEngineClient::pause() {
    report(engine_.pause());
}

void LocalEngineClient::stop() {
    report(engine_.stop());
}

void LocalEngineClient::togglePlay() {
    report(engine_.togglePlay());
}

void LocalEngineClient::seekSeconds(double seconds) {
    report(engine_.seekSeconds(seconds));
}

void LocalEngineClient::setLoopSeconds(double startSeconds, double endSeconds, bool enabled) {
    report(engine_.setLoopSeconds(startSeconds, endSeconds, enabled));
}

void LocalEngineClient::setLoopEnabled(bool enabled) {
    report(engine_.setLoopEnabled(enabled));
}

void LocalEngineClient::setSpeed(double ratio) {
    report(engine_.setSpeed(ratio));
}

void LocalEngineClient::clearError() {
    engine_.clearError();
}

void LocalEngineClient::poll() {
    EngineStatus st = engine_.status();

    snap_.state = st.state;
    snap_.positionSeconds = st.positionSeconds;
    snap_.durationSeconds = st.durationSeconds;
    snap_.speed = st.speed;
    snap_.sourceName = st.sourceName;
    snap_.channels = st.channels;
    snap_.sampleRate = st.sampleRate;
    snap_.totalFrames = st.totalFrames;

    snap_.hasLoop = st.loop.isValid();
    snap_.loopEnabled = st.loop.enabled && snap_.hasLoop;
    if (st.sampleRate > 0.0) {
        snap_.loopStartSeconds = static_cast<double>(st.loop.startFrame) / st.sampleRate;
        snap_.loopEndSeconds = static_cast<double>(st.loop.endFrame) / st.sampleRate;
    } else {
        snap_.loopStartSeconds = snap_.loopEndSeconds = 0.0;
    }

    snap_.underrunCount = st.underrunCount;
    snap_.underrunWarning = st.underrunWarning;
    snap_.lastError = (st.lastError == ErrorKind::None)
        ? std::string()
        : errorKindName(st.lastError) + ": " + st.lastErrorMessage;

    // Preview only changes with the asset
    auto asset = engine_.currentAsset();
    if (asset != previewAsset_) {
        previewAsset_ = asset;
        snap_.preview = asset ? asset->previewBuckets(kPreviewBuckets) : std::vector<float>{};
    }

    // Drain buffered messages
    {
        std::lock_guard<std::mutex> lock(msgMutex_);
        snap_.messages = std::move(pendingMessages_);
        pendingMessages_.clear();
    }
}

void LocalEngineClient::report(const CommandResult& result) {
    if (!result.ok()) {
        pushMessage(errorKindName(result.error) + ": " + result.message);
    }
}

void LocalEngineClient::pushMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(msgMutex_);
    pendingMessages_.push_back(msg);
}

} // namespace loopah
