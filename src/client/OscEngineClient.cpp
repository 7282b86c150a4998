#include "client/OscEngineClient.h"

#include <cstdio>
#include <cstring>

namespace loopah {

OscEngineClient::OscEngineClient(const std::string& host, const std::string& port)
    : host_(host)
    , port_(port)
{
    // Create non-threaded server on ephemeral port for receiving state pushes
    server_ = lo_server_new(nullptr, errorHandler);
    if (!server_) {
        fprintf(stderr, "OscEngineClient: failed to create local server\n");
        return;
    }
    localPort_ = lo_server_get_port(server_);

    // Create address for sending commands to the server
    serverAddr_ = lo_address_new(host_.c_str(), port_.c_str());
    if (!serverAddr_) {
        fprintf(stderr, "OscEngineClient: failed to create server address %s:%s\n",
                host_.c_str(), port_.c_str());
        lo_server_free(server_);
        server_ = nullptr;
        return;
    }

    // Register state handlers
    lo_server_add_method(server_, "/loopah/state/transport", "iddd",
                         handleTransport, this);
    lo_server_add_method(server_, "/loopah/state/loop", "ddi",
                         handleLoop, this);
    lo_server_add_method(server_, "/loopah/state/asset", "siih",
                         handleAsset, this);
    lo_server_add_method(server_, "/loopah/state/health", "iis",
                         handleHealth, this);
    lo_server_add_method(server_, "/loopah/state/preview", "b",
                         handlePreview, this);
    lo_server_add_method(server_, "/loopah/state/log", "s",
                         handleLog, this);

    fprintf(stderr, "OscEngineClient: connecting to %s:%s, listening on port %d\n",
            host_.c_str(), port_.c_str(), localPort_);

    // Send initial subscribe
    subscribe();
}

OscEngineClient::~OscEngineClient() {
    // Unsubscribe
    if (serverAddr_ && server_) {
        lo_send(serverAddr_, "/loopah/client/unsubscribe", "si",
                "localhost", localPort_);
    }

    if (serverAddr_) lo_address_free(serverAddr_);
    if (server_) lo_server_free(server_);
}

void OscEngineClient::subscribe() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/client/subscribe", "si",
            "localhost", localPort_);
    lastSubscribe_ = std::chrono::steady_clock::now();
}

void OscEngineClient::poll() {
    if (!server_) return;

    // Clear per-frame data
    snap_.messages.clear();

    // Drain all pending OSC messages (non-blocking)
    while (lo_server_recv_noblock(server_, 0) > 0) {
        // Messages are processed by handlers
    }

    // Periodic heartbeat/resubscribe
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - lastSubscribe_).count();
    if (elapsed >= kHeartbeatIntervalSec) {
        subscribe();
    }
}

// --- Commands ---

void OscEngineClient::load(const std::string& path) {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/load", "s", path.c_str());
}

void OscEngineClient::play() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/play", "");
}

void OscEngineClient::pause() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/pause", "");
}

void OscEngineClient::stop() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/stop", "");
}

void OscEngineClient::togglePlay() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/toggle", "");
}

void OscEngineClient::seekSeconds(double seconds) {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/seek", "d", seconds);
}

void OscEngineClient::setLoopSeconds(double startSeconds, double endSeconds, bool enabled) {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/loop", "ddi", startSeconds, endSeconds, enabled ? 1 : 0);
}

void OscEngineClient::setLoopEnabled(bool enabled) {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/loop/enabled", "i", enabled ? 1 : 0);
}

void OscEngineClient::setSpeed(double ratio) {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/speed", "d", ratio);
    // Also update local snapshot for immediate UI feedback
    snap_.speed = ratio;
}

void OscEngineClient::clearError() {
    if (!serverAddr_) return;
    lo_send(serverAddr_, "/loopah/error/clear", "");
    snap_.lastError.clear();
}

// --- State handlers ---

int OscEngineClient::handleTransport(const char*, const char*, lo_arg** argv,
                                     int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    self->snap_.state = intToTransportState(argv[0]->i);
    self->snap_.positionSeconds = argv[1]->d;
    self->snap_.speed = argv[2]->d;
    self->snap_.durationSeconds = argv[3]->d;
    return 0;
}

int OscEngineClient::handleLoop(const char*, const char*, lo_arg** argv,
                                int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    self->snap_.loopStartSeconds = argv[0]->d;
    self->snap_.loopEndSeconds = argv[1]->d;
    self->snap_.hasLoop = argv[1]->d > argv[0]->d;
    self->snap_.loopEnabled = self->snap_.hasLoop && argv[2]->i != 0;
    return 0;
}

int OscEngineClient::handleAsset(const char*, const char*, lo_arg** argv,
                                 int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    self->snap_.sourceName = &argv[0]->s;
    self->snap_.channels = argv[1]->i;
    self->snap_.sampleRate = static_cast<double>(argv[2]->i);
    self->snap_.totalFrames = argv[3]->h;
    if (self->snap_.totalFrames == 0) {
        self->snap_.preview.clear();
    }
    return 0;
}

int OscEngineClient::handleHealth(const char*, const char*, lo_arg** argv,
                                  int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    self->snap_.underrunCount = argv[0]->i;
    self->snap_.underrunWarning = argv[1]->i != 0;
    self->snap_.lastError = &argv[2]->s;
    return 0;
}

int OscEngineClient::handlePreview(const char*, const char*, lo_arg** argv,
                                   int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    lo_blob blob = reinterpret_cast<lo_blob>(argv[0]);
    uint32_t size = lo_blob_datasize(blob);
    size_t count = size / sizeof(float);

    self->snap_.preview.resize(count);
    if (count > 0) {
        std::memcpy(self->snap_.preview.data(), lo_blob_dataptr(blob),
                    count * sizeof(float));
    }
    return 0;
}

int OscEngineClient::handleLog(const char*, const char*, lo_arg** argv,
                               int, lo_message, void* user) {
    auto* self = static_cast<OscEngineClient*>(user);
    self->snap_.messages.push_back(&argv[0]->s);
    return 0;
}

void OscEngineClient::errorHandler(int num, const char* msg, const char* path) {
    fprintf(stderr, "OscEngineClient error %d: %s (path: %s)\n",
            num, msg, path ? path : "null");
}

} // namespace loopah
