#pragma once

#include "core/PlayerEngine.h"
#include <lo/lo.h>

#include <vector>
#include <mutex>
#include <string>
#include <chrono>

namespace loopah {

/// A subscribed OSC client that receives state pushes
struct OscSubscriber {
    lo_address addr = nullptr;
    std::chrono::steady_clock::time_point lastSeen;
    uint64_t previewGeneration = 0;   // Sample store generation of the last preview sent
};

/// OSC server that wraps a PlayerEngine, receives commands via OSC,
/// and pushes state to subscribed clients at ~30Hz.
class OscServer {
public:
    /// Preview values sent per asset
    static constexpr int kPreviewBuckets = 512;

    OscServer(PlayerEngine& engine, const std::string& port = "7770");
    ~OscServer();

    /// Start the OSC listener thread
    bool start();

    /// Stop the OSC listener thread
    void stop();

    /// Push current engine state to all subscribed clients.
    /// Call this from the main loop at ~30Hz.
    void pushState();

    /// Callbacks that queue engine messages for /loopah/state/log.
    /// Install on the engine directly (headless) or forward from a client.
    EngineCallbacks engineCallbacks();

    /// Get the port the server is listening on
    std::string port() const { return port_; }

private:
    // OSC handler callbacks (static trampolines)
    static int handleLoad(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handlePlay(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handlePause(const char* path, const char* types,
                           lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleStop(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleToggle(const char* path, const char* types,
                            lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleSeek(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleLoop(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleLoopEnabled(const char* path, const char* types,
                                 lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleSpeed(const char* path, const char* types,
                           lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleClearError(const char* path, const char* types,
                                lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleSubscribe(const char* path, const char* types,
                               lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleUnsubscribe(const char* path, const char* types,
                                 lo_arg** argv, int argc, lo_message msg, void* user);
    static void errorHandler(int num, const char* msg, const char* path);

    /// Queue a rejected command for the log push
    void report(const CommandResult& result);

    void queueMessage(const std::string& msg);

    /// Add or refresh a subscriber
    void addSubscriber(const char* url, int port);

    /// Remove a subscriber
    void removeSubscriber(const char* url, int port);

    /// Prune subscribers that haven't been seen recently
    void pruneSubscribers();

    /// Send state to a single subscriber
    void pushStateTo(OscSubscriber& sub, const EngineStatus& st,
                     const std::vector<std::string>& messages);

    PlayerEngine& engine_;
    std::string port_;
    lo_server_thread serverThread_ = nullptr;

    std::mutex subMutex_;
    std::vector<OscSubscriber> subscribers_;
    static constexpr double kSubscriberTimeoutSec = 30.0;

    // Message buffer for pushing log messages
    std::mutex msgMutex_;
    std::vector<std::string> pendingMessages_;
};

} // namespace loopah
