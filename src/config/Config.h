#pragma once

#include "core/PlayerEngine.h"

#include <optional>
#include <string>

namespace loopah {

struct Config {
    // [audio]
    std::string audioBackend;             // "" = auto, "jack", "alsa"
    int bufferSize = 0;                   // 0 = device default
    double sampleRate = 0.0;              // 0 = device default

    // [engine]
    double minSpeed = 0.125;
    double maxSpeed = 2.0;
    double defaultSpeed = 1.0;
    double speedResetThreshold = 0.5;     // Relative jump that resets the stretcher
    int blockFrames = 512;
    int queueBlocks = 8;
    double underrunWarnPerSec = 2.0;
    std::string stretchPreset = "cheaper"; // "default" or "cheaper"

    // [osc]
    std::string oscPort = "7770";

    // [tui]
    int tuiRefreshMs = 33;
    double seekStepSeconds = 5.0;
    double speedStep = 0.05;

    // CLI-only fields
    std::string inputFile;
    bool headless = false;
    std::string connectTarget;
    bool showHelp = false;
    std::optional<double> loopStartSeconds;
    std::optional<double> loopEndSeconds;

    /// Load config from the TOML file (if it exists).
    /// Missing file or missing fields silently use defaults.
    static Config load();

    /// Load from an explicit path. Invalid values print a warning and keep
    /// the default.
    static Config loadFromFile(const std::string& path);

    /// Returns the path to the config file.
    static std::string configFilePath();

    /// Parse CLI arguments, mutating this config in-place.
    /// Returns true if the program should continue, false if it should exit.
    /// Sets exitCode to the exit code when returning false.
    bool parseArgs(int argc, char* argv[], int& exitCode);

    /// Engine settings for a device running at deviceSampleRate
    EngineSettings engineSettings(double deviceSampleRate) const;
};

} // namespace loopah
