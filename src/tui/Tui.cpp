#include "tui/Tui.h"
#include <ncurses.h>
#include <cmath>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace loopah {

namespace {

std::string formatTime(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    int minutes = static_cast<int>(seconds / 60.0);
    double rest = seconds - minutes * 60.0;
    std::ostringstream ss;
    ss << minutes << ":" << std::fixed << std::setprecision(2)
       << std::setw(5) << std::setfill('0') << rest;
    return ss.str();
}

// Darkest to brightest
constexpr char kLevelChars[] = " .:-=+*#%@";
constexpr int kLevelCount = sizeof(kLevelChars) - 1;

} // namespace

Tui::Tui(EngineClient& client, double seekStepSeconds, double speedStep)
    : client_(client)
    , seekStep_(seekStepSeconds)
    , speedStep_(speedStep)
{
}

Tui::~Tui() {
    shutdown();
}

bool Tui::init() {
    initscr();
    if (!stdscr) return false;

    cbreak();             // Disable line buffering
    noecho();             // Don't echo input
    keypad(stdscr, TRUE); // Enable special keys
    nodelay(stdscr, TRUE); // Non-blocking input
    curs_set(0);          // Hide cursor

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_GREEN, -1);    // Playing
        init_pair(2, COLOR_YELLOW, -1);   // Paused / warnings
        init_pair(3, COLOR_RED, -1);      // Errors
        init_pair(4, COLOR_CYAN, -1);     // Loop region
        init_pair(5, COLOR_WHITE, -1);    // Default
        init_pair(6, COLOR_MAGENTA, -1);  // Playhead
        init_pair(7, COLOR_BLUE, -1);     // Header
    }

    getmaxyx(stdscr, termHeight_, termWidth_);
    initialized_ = true;
    needsRedraw_ = true;
    return true;
}

void Tui::shutdown() {
    if (initialized_) {
        endwin();
        initialized_ = false;
    }
}

bool Tui::update() {
    if (!initialized_) return false;

    // Poll client for latest state
    client_.poll();

    // Drain messages from client into our log
    for (const auto& msg : client_.snapshot().messages) {
        addMessage(msg);
    }

    // Handle resize
    int h, w;
    getmaxyx(stdscr, h, w);
    if (h != termHeight_ || w != termWidth_) {
        termHeight_ = h;
        termWidth_ = w;
        needsRedraw_ = true;
    }

    // Process all available input
    int key;
    while ((key = getch()) != ERR) {
        if (key == 'q' || key == 'Q') {
            return false;
        }
        handleKey(key);
        needsRedraw_ = true;
    }

    // Redraw
    draw();

    return true;
}

void Tui::draw() {
    erase();

    int row = 0;
    drawHeader(row);
    row += 2;

    drawTransport(row);
    row += 4;

    drawOverview(row);
    row += 4;

    drawControls(row);
    row += 5;

    drawMessages(row);

    refresh();
    needsRedraw_ = false;
}

void Tui::drawHeader(int row) {
    const auto& snap = client_.snapshot();

    attron(A_BOLD | COLOR_PAIR(7));
    mvprintw(row, 0, "LOOPAH");
    attroff(A_BOLD | COLOR_PAIR(7));
    mvprintw(row, 8, "v0.1.0 - Practice Player");

    if (snap.hasAsset()) {
        mvprintw(row + 1, 0, "%s  %d ch  %d Hz  %s",
                 snap.sourceName.c_str(), snap.channels,
                 static_cast<int>(snap.sampleRate),
                 formatTime(snap.durationSeconds).c_str());
    } else {
        attron(A_DIM);
        mvprintw(row + 1, 0, "(no file loaded, press o to open)");
        attroff(A_DIM);
    }
}

void Tui::drawTransport(int row) {
    const auto& snap = client_.snapshot();

    attron(A_BOLD);
    mvprintw(row, 0, "TRANSPORT");
    attroff(A_BOLD);

    int colorPair = 5;
    switch (snap.state) {
        case TransportState::Playing: colorPair = 1; break;
        case TransportState::Paused:  colorPair = 2; break;
        case TransportState::Stopped: colorPair = 5; break;
    }
    attron(COLOR_PAIR(colorPair) | A_BOLD);
    mvprintw(row, 12, "%-8s", transportStateName(snap.state).c_str());
    attroff(COLOR_PAIR(colorPair) | A_BOLD);

    mvprintw(row, 22, "%s / %s   Speed: %.2fx",
             formatTime(snap.positionSeconds).c_str(),
             formatTime(snap.durationSeconds).c_str(),
             snap.speed);

    // Loop region
    if (snap.hasLoop) {
        attron(snap.loopEnabled ? (COLOR_PAIR(4) | A_BOLD) : A_DIM);
        mvprintw(row + 1, 2, "Loop: %s - %s  %s",
                 formatTime(snap.loopStartSeconds).c_str(),
                 formatTime(snap.loopEndSeconds).c_str(),
                 snap.loopEnabled ? "ON" : "OFF");
        attroff(snap.loopEnabled ? (COLOR_PAIR(4) | A_BOLD) : A_DIM);
    } else {
        mvprintw(row + 1, 2, "Loop: (none)");
    }
    if (markA_) {
        attron(COLOR_PAIR(4));
        mvprintw(row + 1, 40, "A marked at %s", formatTime(*markA_).c_str());
        attroff(COLOR_PAIR(4));
    }

    // Health
    if (snap.underrunWarning) {
        attron(COLOR_PAIR(2) | A_BOLD);
        mvprintw(row + 2, 2, "Underruns: %lld (audio is glitching)",
                 static_cast<long long>(snap.underrunCount));
        attroff(COLOR_PAIR(2) | A_BOLD);
    } else {
        mvprintw(row + 2, 2, "Underruns: %lld",
                 static_cast<long long>(snap.underrunCount));
    }
    if (!snap.lastError.empty()) {
        attron(COLOR_PAIR(3) | A_BOLD);
        mvprintw(row + 2, 30, "%s", snap.lastError.c_str());
        attroff(COLOR_PAIR(3) | A_BOLD);
    }
}

void Tui::drawOverview(int row) {
    const auto& snap = client_.snapshot();

    attron(A_BOLD);
    mvprintw(row, 0, "OVERVIEW");
    attroff(A_BOLD);

    int width = termWidth_ - 4;
    if (width < 8 || !snap.hasAsset() || snap.durationSeconds <= 0.0) return;

    // Level row: max of the preview buckets under each column
    const auto& preview = snap.preview;
    size_t buckets = preview.size();
    for (int col = 0; col < width; ++col) {
        float level = 0.0f;
        if (buckets > 0) {
            size_t first = buckets * static_cast<size_t>(col) / static_cast<size_t>(width);
            size_t last = buckets * static_cast<size_t>(col + 1) / static_cast<size_t>(width);
            last = std::max(last, first + 1);
            for (size_t i = first; i < last && i < buckets; ++i) {
                level = std::max(level, preview[i]);
            }
        }
        // sqrt lifts quiet passages so they stay visible
        int idx = static_cast<int>(std::sqrt(std::clamp(level, 0.0f, 1.0f)) * (kLevelCount - 1) + 0.5f);
        bool inLoop = false;
        if (snap.hasLoop) {
            double t = (col + 0.5) / width * snap.durationSeconds;
            inLoop = t >= snap.loopStartSeconds && t < snap.loopEndSeconds;
        }
        if (inLoop) attron(COLOR_PAIR(4));
        mvaddch(row + 1, 2 + col, kLevelChars[idx]);
        if (inLoop) attroff(COLOR_PAIR(4));
    }

    // Marker row: loop brackets and playhead
    auto columnFor = [&](double seconds) {
        int col = static_cast<int>(seconds / snap.durationSeconds * width);
        return std::clamp(col, 0, width - 1);
    };

    if (snap.hasLoop) {
        attron(COLOR_PAIR(4) | (snap.loopEnabled ? A_BOLD : A_DIM));
        mvaddch(row + 2, 2 + columnFor(snap.loopStartSeconds), '[');
        mvaddch(row + 2, 2 + columnFor(snap.loopEndSeconds), ']');
        attroff(COLOR_PAIR(4) | (snap.loopEnabled ? A_BOLD : A_DIM));
    }
    if (markA_) {
        attron(COLOR_PAIR(4));
        mvaddch(row + 2, 2 + columnFor(*markA_), 'A');
        attroff(COLOR_PAIR(4));
    }

    attron(COLOR_PAIR(6) | A_BOLD);
    mvaddch(row + 2, 2 + columnFor(snap.positionSeconds), '^');
    attroff(COLOR_PAIR(6) | A_BOLD);
}

void Tui::drawControls(int startRow) {
    attron(A_BOLD);
    mvprintw(startRow, 0, "CONTROLS");
    attroff(A_BOLD);

    mvprintw(startRow + 1, 2, "SPACE: Play/pause    s: Stop             Left/Right: Seek -/+%.0fs", seekStep_);
    mvprintw(startRow + 2, 2, "[/]: Speed -/+       =: Speed 1x         a/b: Loop start/end");
    mvprintw(startRow + 3, 2, "l: Loop on/off       o: Open file        Esc: Clear error");
    mvprintw(startRow + 4, 2, "q: Quit");
}

void Tui::drawMessages(int startRow) {
    attron(A_BOLD);
    mvprintw(startRow, 0, "LOG");
    attroff(A_BOLD);

    std::lock_guard<std::mutex> lock(messageMutex_);
    int row = startRow + 1;
    for (const auto& msg : messages_) {
        if (row >= termHeight_ - 1) break;
        mvprintw(row, 2, "%s", msg.c_str());
        ++row;
    }
}

void Tui::handleKey(int key) {
    const auto& snap = client_.snapshot();

    switch (key) {
        case ' ':
            client_.togglePlay();
            break;

        case 's':
            client_.stop();
            break;

        case KEY_LEFT:
            client_.seekSeconds(std::max(0.0, snap.positionSeconds - seekStep_));
            break;

        case KEY_RIGHT:
            client_.seekSeconds(snap.positionSeconds + seekStep_);
            break;

        case KEY_HOME:
            client_.seekSeconds(snap.loopEnabled ? snap.loopStartSeconds : 0.0);
            break;

        // Speed decrease
        case '[': {
            double speed = snap.speed - speedStep_;
            client_.setSpeed(speed);
            addMessage("Speed: " + std::to_string(static_cast<int>(std::lround(speed * 100.0))) + "%");
            break;
        }

        // Speed increase
        case ']': {
            double speed = snap.speed + speedStep_;
            client_.setSpeed(speed);
            addMessage("Speed: " + std::to_string(static_cast<int>(std::lround(speed * 100.0))) + "%");
            break;
        }

        case '=':
            client_.setSpeed(1.0);
            addMessage("Speed: 100%");
            break;

        case 'a':
            setLoopStartMarker();
            break;

        case 'b':
            setLoopEndMarker();
            break;

        case 'l':
            if (!snap.hasLoop) {
                addMessage("No loop region (mark with a and b)");
            } else {
                client_.setLoopEnabled(!snap.loopEnabled);
            }
            break;

        case 'o': {
            std::string path = prompt("Open: ");
            if (!path.empty()) {
                markA_.reset();
                client_.load(path);
            }
            break;
        }

        case 27: // Escape
            markA_.reset();
            client_.clearError();
            break;

        default:
            break;
    }
}

void Tui::setLoopStartMarker() {
    const auto& snap = client_.snapshot();
    if (!snap.hasAsset()) {
        addMessage("Nothing loaded");
        return;
    }
    markA_ = snap.positionSeconds;
    addMessage("Loop start marked");
}

void Tui::setLoopEndMarker() {
    const auto& snap = client_.snapshot();
    if (!snap.hasAsset()) {
        addMessage("Nothing loaded");
        return;
    }

    // Without a fresh A mark, keep the current loop start
    double start = markA_ ? *markA_ : (snap.hasLoop ? snap.loopStartSeconds : 0.0);
    double end = snap.positionSeconds;
    if (end < start) std::swap(start, end);

    markA_.reset();
    client_.setLoopSeconds(start, end, true);
}

std::string Tui::prompt(const std::string& label) {
    int row = termHeight_ - 1;
    move(row, 0);
    clrtoeol();
    mvprintw(row, 0, "%s", label.c_str());

    nodelay(stdscr, FALSE);
    echo();
    curs_set(1);

    char buf[1024] = {0};
    int rc = getnstr(buf, static_cast<int>(sizeof(buf)) - 1);

    curs_set(0);
    noecho();
    nodelay(stdscr, TRUE);

    if (rc == ERR) return {};

    // Trim surrounding whitespace
    std::string s(buf);
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

void Tui::addMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(messageMutex_);
    messages_.push_front(msg);
    while (static_cast<int>(messages_.size()) > maxMessages_) {
        messages_.pop_back();
    }
}

} // namespace loopah
