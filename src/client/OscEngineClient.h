#pragma once

#include "client/EngineClient.h"
#include <lo/lo.h>

#include <string>
#include <chrono>

namespace loopah {

/// OSC-based EngineClient that communicates with a remote OscServer.
/// Commands are sent as OSC messages; state is received via pushed updates.
/// Uses a non-threaded lo_server, all receiving happens in poll().
class OscEngineClient : public EngineClient {
public:
    /// Connect to an OSC server at host:port
    OscEngineClient(const std::string& host, const std::string& port);
    ~OscEngineClient() override;

    /// Whether the client successfully initialized
    bool isValid() const { return server_ != nullptr && serverAddr_ != nullptr; }

    // Commands
    void load(const std::string& path) override;
    void play() override;
    void pause() override;
    void stop() override;
    void togglePlay() override;
    void seekSeconds(double seconds) override;
    void setLoopSeconds(double startSeconds, double endSeconds, bool enabled) override;
    void setLoopEnabled(bool enabled) override;
    void setSpeed(double ratio) override;
    void clearError() override;

    // State
    const PlayerSnapshot& snapshot() const override { return snap_; }
    void poll() override;

private:
    void subscribe();

    // OSC state handlers (static trampolines)
    static int handleTransport(const char* path, const char* types,
                               lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleLoop(const char* path, const char* types,
                          lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleAsset(const char* path, const char* types,
                           lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleHealth(const char* path, const char* types,
                            lo_arg** argv, int argc, lo_message msg, void* user);
    static int handlePreview(const char* path, const char* types,
                             lo_arg** argv, int argc, lo_message msg, void* user);
    static int handleLog(const char* path, const char* types,
                         lo_arg** argv, int argc, lo_message msg, void* user);
    static void errorHandler(int num, const char* msg, const char* path);

    lo_server server_ = nullptr;       // Non-threaded receiver
    lo_address serverAddr_ = nullptr;  // Server we send commands to
    std::string host_;
    std::string port_;
    int localPort_ = 0;

    PlayerSnapshot snap_;

    // Heartbeat/subscribe timer
    std::chrono::steady_clock::time_point lastSubscribe_;
    static constexpr double kHeartbeatIntervalSec = 10.0;
};

} // namespace loopah
