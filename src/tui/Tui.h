#pragma once

#include "client/EngineClient.h"
#include <string>
#include <vector>
#include <mutex>
#include <deque>
#include <optional>

namespace loopah {

/// ncurses front end for the player.
/// Displays transport, loop region and a waveform overview, and accepts keyboard input.
class Tui {
public:
    /// @param seekStepSeconds Left/right arrow seek distance
    /// @param speedStep       [ / ] speed change
    explicit Tui(EngineClient& client, double seekStepSeconds = 5.0, double speedStep = 0.05);
    ~Tui();

    /// Initialize ncurses
    bool init();

    /// Shut down ncurses
    void shutdown();

    /// Process one frame of the TUI: handle input, redraw.
    /// Returns false if the user wants to quit.
    bool update();

    /// Add a message to the log
    void addMessage(const std::string& msg);

private:
    void draw();
    void drawHeader(int row);
    void drawTransport(int row);
    void drawOverview(int row);
    void drawControls(int startRow);
    void drawMessages(int startRow);
    void handleKey(int key);

    /// Blocking line prompt on the bottom row; empty string on cancel
    std::string prompt(const std::string& label);

    void setLoopStartMarker();
    void setLoopEndMarker();

    EngineClient& client_;
    double seekStep_;
    double speedStep_;
    bool initialized_ = false;
    bool needsRedraw_ = true;

    // Loop start marked with 'a', waiting for 'b'
    std::optional<double> markA_;

    std::mutex messageMutex_;
    std::deque<std::string> messages_;
    static constexpr int maxMessages_ = 8;

    int termWidth_ = 80;
    int termHeight_ = 24;
};

} // namespace loopah
