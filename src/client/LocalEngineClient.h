#pragma once

#include "client/EngineClient.h"
#include "core/PlayerEngine.h"

#include <mutex>
#include <vector>
#include <string>

namespace loopah {

/// In-process EngineClient that wraps a PlayerEngine& directly.
/// Used in standalone mode and server+TUI mode.
class LocalEngineClient : public EngineClient {
public:
    /// Installs engine callbacks; forwardTo (if set) also receives messages
    explicit LocalEngineClient(PlayerEngine& engine, EngineCallbacks forwardTo = {});

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
    /// Surface a rejected command in the message log
    void report(const CommandResult& result);

    void pushMessage(const std::string& msg);

    PlayerEngine& engine_;
    EngineCallbacks forward_;
    PlayerSnapshot snap_;
    std::shared_ptr<const AudioAsset> previewAsset_;

    // Message buffer (filled from engine callback, drained in poll)
    std::mutex msgMutex_;
    std::vector<std::string> pendingMessages_;
};

} // namespace loopah
