#include "config/Config.h"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <string>

namespace loopah {

namespace {

/// Parse a non-negative number, rejecting trailing garbage
bool parseNonNegative(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !(v >= 0.0)) return false;
    out = v;
    return true;
}

} // namespace

std::string Config::configFilePath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/loopah/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/loopah/config.toml";
    }
    return {};
}

Config Config::load() {
    return loadFromFile(configFilePath());
}

Config Config::loadFromFile(const std::string& path) {
    Config cfg;

    if (path.empty() || !std::filesystem::exists(path)) {
        return cfg;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        fprintf(stderr, "Warning: failed to parse %s: %s\n",
                path.c_str(), err.what());
        return cfg;
    }

    // [audio]
    if (auto v = tbl["audio"]["backend"].value<std::string>()) {
        if (*v == "jack" || *v == "alsa" || v->empty()) {
            cfg.audioBackend = *v;
        } else {
            fprintf(stderr, "Warning: invalid audio.backend '%s', using auto\n", v->c_str());
        }
    }
    if (auto v = tbl["audio"]["buffer_size"].value<int64_t>()) {
        if (*v == 0 || (*v >= 16 && *v <= 8192)) {
            cfg.bufferSize = static_cast<int>(*v);
        } else {
            fprintf(stderr, "Warning: invalid audio.buffer_size %lld, using device default\n",
                    static_cast<long long>(*v));
        }
    }
    if (auto v = tbl["audio"]["sample_rate"].value<double>()) {
        if (*v == 0.0 || (*v >= 8000.0 && *v <= 384000.0)) {
            cfg.sampleRate = *v;
        } else {
            fprintf(stderr, "Warning: invalid audio.sample_rate %.0f, using device default\n", *v);
        }
    }

    // [engine]
    if (auto v = tbl["engine"]["min_speed"].value<double>()) {
        if (*v >= TimeStretcher::kMinSpeed && *v <= 1.0) {
            cfg.minSpeed = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.min_speed %.3f, using default %.3f\n",
                    *v, cfg.minSpeed);
        }
    }
    if (auto v = tbl["engine"]["max_speed"].value<double>()) {
        if (*v >= 1.0 && *v <= TimeStretcher::kMaxSpeed) {
            cfg.maxSpeed = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.max_speed %.3f, using default %.3f\n",
                    *v, cfg.maxSpeed);
        }
    }
    if (auto v = tbl["engine"]["default_speed"].value<double>()) {
        if (*v >= cfg.minSpeed && *v <= cfg.maxSpeed) {
            cfg.defaultSpeed = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.default_speed %.3f, using default %.3f\n",
                    *v, cfg.defaultSpeed);
        }
    }
    if (auto v = tbl["engine"]["speed_reset_threshold"].value<double>()) {
        if (*v >= 0.0 && *v <= 10.0) {
            cfg.speedResetThreshold = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.speed_reset_threshold %.3f, using default %.3f\n",
                    *v, cfg.speedResetThreshold);
        }
    }
    if (auto v = tbl["engine"]["block_frames"].value<int64_t>()) {
        if (*v >= 64 && *v <= 4096) {
            cfg.blockFrames = static_cast<int>(*v);
        } else {
            fprintf(stderr, "Warning: invalid engine.block_frames %lld, using default %d\n",
                    static_cast<long long>(*v), cfg.blockFrames);
        }
    }
    if (auto v = tbl["engine"]["queue_blocks"].value<int64_t>()) {
        if (*v >= 2 && *v <= 64) {
            cfg.queueBlocks = static_cast<int>(*v);
        } else {
            fprintf(stderr, "Warning: invalid engine.queue_blocks %lld, using default %d\n",
                    static_cast<long long>(*v), cfg.queueBlocks);
        }
    }
    if (auto v = tbl["engine"]["underrun_warn_per_sec"].value<double>()) {
        if (*v >= 0.0) {
            cfg.underrunWarnPerSec = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.underrun_warn_per_sec %.2f, using default %.2f\n",
                    *v, cfg.underrunWarnPerSec);
        }
    }
    if (auto v = tbl["engine"]["stretch_preset"].value<std::string>()) {
        if (*v == "default" || *v == "cheaper") {
            cfg.stretchPreset = *v;
        } else {
            fprintf(stderr, "Warning: invalid engine.stretch_preset '%s', using default '%s'\n",
                    v->c_str(), cfg.stretchPreset.c_str());
        }
    }

    // [osc]
    // Accept port as either string or integer
    if (auto node = tbl["osc"]["port"]) {
        if (auto v = node.value<std::string>()) {
            cfg.oscPort = *v;
        } else if (auto v = node.value<int64_t>()) {
            cfg.oscPort = std::to_string(*v);
        }
    }

    // [tui]
    if (auto v = tbl["tui"]["refresh_ms"].value<int64_t>()) {
        if (*v >= 10 && *v <= 1000) {
            cfg.tuiRefreshMs = static_cast<int>(*v);
        } else {
            fprintf(stderr, "Warning: invalid tui.refresh_ms %lld, using default %d\n",
                    static_cast<long long>(*v), cfg.tuiRefreshMs);
        }
    }
    if (auto v = tbl["tui"]["seek_step_seconds"].value<double>()) {
        if (*v > 0.0 && *v <= 600.0) {
            cfg.seekStepSeconds = *v;
        } else {
            fprintf(stderr, "Warning: invalid tui.seek_step_seconds %.2f, using default %.2f\n",
                    *v, cfg.seekStepSeconds);
        }
    }
    if (auto v = tbl["tui"]["speed_step"].value<double>()) {
        if (*v > 0.0 && *v <= 1.0) {
            cfg.speedStep = *v;
        } else {
            fprintf(stderr, "Warning: invalid tui.speed_step %.3f, using default %.3f\n",
                    *v, cfg.speedStep);
        }
    }

    return cfg;
}

bool Config::parseArgs(int argc, char* argv[], int& exitCode) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--jack") {
            audioBackend = "jack";
        } else if (arg == "--alsa") {
            audioBackend = "alsa";
        } else if (arg == "--headless") {
            headless = true;
        } else if (arg == "--connect") {
            if (i + 1 < argc) {
                connectTarget = argv[++i];
            } else {
                fprintf(stderr, "--connect requires HOST:PORT argument\n");
                exitCode = 1;
                return false;
            }
        } else if (arg == "--port") {
            if (i + 1 < argc) {
                oscPort = argv[++i];
            } else {
                fprintf(stderr, "--port requires a port argument\n");
                exitCode = 1;
                return false;
            }
        } else if (arg == "--speed") {
            double speed = 0.0;
            if (i + 1 < argc && parseNonNegative(argv[i + 1], speed) && speed > 0.0) {
                defaultSpeed = speed;
                ++i;
            } else {
                fprintf(stderr, "--speed requires a positive ratio (e.g. 0.75)\n");
                exitCode = 1;
                return false;
            }
        } else if (arg == "--loop") {
            std::string range = (i + 1 < argc) ? argv[++i] : "";
            auto colon = range.find(':');
            double a = 0.0, b = 0.0;
            if (colon == std::string::npos ||
                !parseNonNegative(range.substr(0, colon), a) ||
                !parseNonNegative(range.substr(colon + 1), b) || a >= b) {
                fprintf(stderr, "--loop requires START:END in seconds with START < END\n");
                exitCode = 1;
                return false;
            }
            loopStartSeconds = a;
            loopEndSeconds = b;
        } else if (arg == "--help" || arg == "-h") {
            showHelp = true;
            exitCode = 0;
            return false;
        } else if (arg[0] != '-') {
            inputFile = arg;
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            exitCode = 1;
            return false;
        }
    }
    return true;
}

EngineSettings Config::engineSettings(double deviceSampleRate) const {
    EngineSettings s;
    s.deviceSampleRate = deviceSampleRate;
    s.blockFrames = blockFrames;
    s.queueBlocks = queueBlocks;
    s.speedLimits.minSpeed = minSpeed;
    s.speedLimits.maxSpeed = maxSpeed;
    s.defaultSpeed = defaultSpeed;
    s.speedResetThreshold = speedResetThreshold;
    s.preset = (stretchPreset == "default") ? StretchPreset::Default : StretchPreset::Cheaper;
    s.underrunWarnPerSec = underrunWarnPerSec;
    return s;
}

} // namespace loopah
