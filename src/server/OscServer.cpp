#include "server/OscServer.h"
#include <cstdio>
#include <algorithm>
#include <cstring>

namespace loopah {

OscServer::OscServer(PlayerEngine& engine, const std::string& port)
    : engine_(engine)
    , port_(port)
{
}

OscServer::~OscServer() {
    stop();
}

bool OscServer::start() {
    serverThread_ = lo_server_thread_new(port_.c_str(), errorHandler);
    if (!serverThread_) {
        fprintf(stderr, "OscServer: failed to create server on port %s\n", port_.c_str());
        return false;
    }

    // Register all command handlers
    lo_server_thread_add_method(serverThread_, "/loopah/load", "s",
                                handleLoad, this);
    lo_server_thread_add_method(serverThread_, "/loopah/play", "",
                                handlePlay, this);
    lo_server_thread_add_method(serverThread_, "/loopah/pause", "",
                                handlePause, this);
    lo_server_thread_add_method(serverThread_, "/loopah/stop", "",
                                handleStop, this);
    lo_server_thread_add_method(serverThread_, "/loopah/toggle", "",
                                handleToggle, this);
    lo_server_thread_add_method(serverThread_, "/loopah/seek", "d",
                                handleSeek, this);
    lo_server_thread_add_method(serverThread_, "/loopah/loop", "ddi",
                                handleLoop, this);
    lo_server_thread_add_method(serverThread_, "/loopah/loop/enabled", "i",
                                handleLoopEnabled, this);
    lo_server_thread_add_method(serverThread_, "/loopah/speed", "d",
                                handleSpeed, this);
    lo_server_thread_add_method(serverThread_, "/loopah/error/clear", "",
                                handleClearError, this);
    lo_server_thread_add_method(serverThread_, "/loopah/client/subscribe", "si",
                                handleSubscribe, this);
    lo_server_thread_add_method(serverThread_, "/loopah/client/unsubscribe", "si",
                                handleUnsubscribe, this);

    lo_server_thread_start(serverThread_);
    fprintf(stderr, "OscServer: listening on port %s\n", port_.c_str());
    return true;
}

void OscServer::stop() {
    if (serverThread_) {
        lo_server_thread_stop(serverThread_);
        lo_server_thread_free(serverThread_);
        serverThread_ = nullptr;
    }

    // Clean up subscriber addresses
    std::lock_guard<std::mutex> lock(subMutex_);
    for (auto& sub : subscribers_) {
        if (sub.addr) lo_address_free(sub.addr);
    }
    subscribers_.clear();
}

EngineCallbacks OscServer::engineCallbacks() {
    EngineCallbacks callbacks;
    callbacks.onMessage = [this](const std::string& msg) {
        queueMessage(msg);
    };
    callbacks.onStateChanged = []() {};
    return callbacks;
}

void OscServer::pushState() {
    pruneSubscribers();

    EngineStatus st = engine_.status();
    std::vector<std::string> messages;
    {
        std::lock_guard<std::mutex> lock(msgMutex_);
        messages = std::move(pendingMessages_);
        pendingMessages_.clear();
    }

    std::lock_guard<std::mutex> lock(subMutex_);
    for (auto& sub : subscribers_) {
        pushStateTo(sub, st, messages);
    }
}

void OscServer::pushStateTo(OscSubscriber& sub, const EngineStatus& st,
                            const std::vector<std::string>& messages) {
    lo_address addr = sub.addr;

    // Transport: state, position (s), speed, duration (s)
    lo_send(addr, "/loopah/state/transport", "iddd",
            transportStateToInt(st.state),
            st.positionSeconds,
            st.speed,
            st.durationSeconds);

    // Loop region in seconds
    double loopStart = 0.0, loopEnd = 0.0;
    if (st.sampleRate > 0.0 && st.loop.isValid()) {
        loopStart = static_cast<double>(st.loop.startFrame) / st.sampleRate;
        loopEnd = static_cast<double>(st.loop.endFrame) / st.sampleRate;
    }
    lo_send(addr, "/loopah/state/loop", "ddi",
            loopStart, loopEnd, st.loop.enabled ? 1 : 0);

    // Asset: name, channels, sample rate, frames
    lo_send(addr, "/loopah/state/asset", "siih",
            st.sourceName.c_str(),
            st.channels,
            static_cast<int>(st.sampleRate),
            static_cast<int64_t>(st.totalFrames));

    // Health: underruns, warning flag, error text
    std::string error;
    if (st.lastError != ErrorKind::None) {
        error = errorKindName(st.lastError) + ": " + st.lastErrorMessage;
    }
    lo_send(addr, "/loopah/state/health", "iis",
            static_cast<int>(st.underrunCount),
            st.underrunWarning ? 1 : 0,
            error.c_str());

    // Preview: once per asset, native float32 values
    uint64_t generation = engine_.assetGeneration();
    if (sub.previewGeneration != generation) {
        sub.previewGeneration = generation;
        auto asset = engine_.currentAsset();
        if (asset) {
            std::vector<float> preview = asset->previewBuckets(kPreviewBuckets);
            if (!preview.empty()) {
                lo_blob blob = lo_blob_new(static_cast<int32_t>(preview.size() * sizeof(float)),
                                           preview.data());
                lo_send(addr, "/loopah/state/preview", "b", blob);
                lo_blob_free(blob);
            }
        }
    }

    // Log messages
    for (const auto& msg : messages) {
        lo_send(addr, "/loopah/state/log", "s", msg.c_str());
    }
}

void OscServer::report(const CommandResult& result) {
    if (!result.ok()) {
        queueMessage(errorKindName(result.error) + ": " + result.message);
    }
}

void OscServer::queueMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(msgMutex_);
    pendingMessages_.push_back(msg);
}

// --- Static handler trampolines ---

int OscServer::handleLoad(const char*, const char*, lo_arg** argv,
                          int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.load(&argv[0]->s));
    return 0;
}

int OscServer::handlePlay(const char*, const char*, lo_arg**,
                          int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.play());
    return 0;
}

int OscServer::handlePause(const char*, const char*, lo_arg**,
                           int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.pause());
    return 0;
}

int OscServer::handleStop(const char*, const char*, lo_arg**,
                          int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.stop());
    return 0;
}

int OscServer::handleToggle(const char*, const char*, lo_arg**,
                            int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.togglePlay());
    return 0;
}

int OscServer::handleSeek(const char*, const char*, lo_arg** argv,
                          int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.seekSeconds(argv[0]->d));
    return 0;
}

int OscServer::handleLoop(const char*, const char*, lo_arg** argv,
                          int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.setLoopSeconds(argv[0]->d, argv[1]->d, argv[2]->i != 0));
    return 0;
}

int OscServer::handleLoopEnabled(const char*, const char*, lo_arg** argv,
                                 int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->report(self->engine_.setLoopEnabled(argv[0]->i != 0));
    return 0;
}

int OscServer::handleSpeed(const char*, const char*, lo_arg** argv,
                           int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    double requested = argv[0]->d;
    CommandResult result = self->engine_.setSpeed(requested);
    if (result.ok() && result.value != requested) {
        char buf[96];
        snprintf(buf, sizeof(buf), "Speed clamped to %.3fx", result.value);
        self->queueMessage(buf);
    }
    self->report(result);
    return 0;
}

int OscServer::handleClearError(const char*, const char*, lo_arg**,
                                int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->engine_.clearError();
    return 0;
}

int OscServer::handleSubscribe(const char*, const char*, lo_arg** argv,
                               int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->addSubscriber(&argv[0]->s, argv[1]->i);
    return 0;
}

int OscServer::handleUnsubscribe(const char*, const char*, lo_arg** argv,
                                 int, lo_message, void* user) {
    auto* self = static_cast<OscServer*>(user);
    self->removeSubscriber(&argv[0]->s, argv[1]->i);
    return 0;
}

void OscServer::errorHandler(int num, const char* msg, const char* path) {
    fprintf(stderr, "OscServer error %d: %s (path: %s)\n",
            num, msg, path ? path : "null");
}

void OscServer::addSubscriber(const char* url, int port) {
    std::string portStr = std::to_string(port);
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(subMutex_);

    // Check if already subscribed (refresh timestamp)
    for (auto& sub : subscribers_) {
        const char* existingUrl = lo_address_get_hostname(sub.addr);
        const char* existingPort = lo_address_get_port(sub.addr);
        if (std::strcmp(existingUrl, url) == 0 &&
            std::strcmp(existingPort, portStr.c_str()) == 0) {
            sub.lastSeen = now;
            return;
        }
    }

    // New subscriber
    OscSubscriber sub;
    sub.addr = lo_address_new(url, portStr.c_str());
    if (!sub.addr) {
        fprintf(stderr, "OscServer: invalid subscriber address %s:%d\n", url, port);
        return;
    }
    sub.lastSeen = now;
    subscribers_.push_back(sub);
    fprintf(stderr, "OscServer: client subscribed %s:%d\n", url, port);
}

void OscServer::removeSubscriber(const char* url, int port) {
    std::string portStr = std::to_string(port);

    std::lock_guard<std::mutex> lock(subMutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
            [&](const OscSubscriber& sub) {
                const char* h = lo_address_get_hostname(sub.addr);
                const char* p = lo_address_get_port(sub.addr);
                if (std::strcmp(h, url) == 0 && std::strcmp(p, portStr.c_str()) == 0) {
                    lo_address_free(sub.addr);
                    return true;
                }
                return false;
            }),
        subscribers_.end());
    fprintf(stderr, "OscServer: client unsubscribed %s:%d\n", url, port);
}

void OscServer::pruneSubscribers() {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(subMutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
            [&](const OscSubscriber& sub) {
                double age = std::chrono::duration<double>(now - sub.lastSeen).count();
                if (age > kSubscriberTimeoutSec) {
                    fprintf(stderr, "OscServer: pruning stale client %s:%s\n",
                            lo_address_get_hostname(sub.addr),
                            lo_address_get_port(sub.addr));
                    lo_address_free(sub.addr);
                    return true;
                }
                return false;
            }),
        subscribers_.end());
}

} // namespace loopah
