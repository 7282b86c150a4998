#include "config/Config.h"
#include "core/PlayerEngine.h"
#include "tui/Tui.h"
#include "client/LocalEngineClient.h"
#include "client/OscEngineClient.h"
#include "server/OscServer.h"

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_core/juce_core.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdio>
#include <memory>

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

/// Bridges JUCE audio output to the PlayerEngine
class AudioCallback : public juce::AudioIODeviceCallback {
public:
    explicit AudioCallback(loopah::PlayerEngine& engine) : engine_(engine) {}

    void audioDeviceIOCallbackWithContext(
            const float* const*,
            int,
            float* const* outputChannelData,
            int numOutputChannels,
            int numSamples,
            const juce::AudioIODeviceCallbackContext&) override {

        // Engine fills every output channel (silence when nothing is queued)
        engine_.renderOutput(outputChannelData, numOutputChannels, numSamples);
    }

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override {
        fprintf(stderr, "Audio device starting: %s\n",
                device->getName().toRawUTF8());
        fprintf(stderr, "  Sample rate: %.0f Hz\n", device->getCurrentSampleRate());
        fprintf(stderr, "  Buffer size: %d samples\n",
                device->getCurrentBufferSizeSamples());
    }

    void audioDeviceStopped() override {
        fprintf(stderr, "Audio device stopped\n");
    }

private:
    loopah::PlayerEngine& engine_;
};

enum class RunMode {
    Tui,         // audio + OscServer + LocalEngineClient + TUI (default)
    Headless,    // audio + OscServer, no TUI
    TuiOnly      // OscEngineClient + TUI, no audio
};

static void printUsage(const loopah::Config& cfg) {
    fprintf(stdout, "Usage: loopah [OPTIONS] [FILE]\n");
    fprintf(stdout, "Options:\n");
    fprintf(stdout, "  --jack                Use JACK audio backend\n");
    fprintf(stdout, "  --alsa                Use ALSA audio backend\n");
    fprintf(stdout, "  --headless            Run without TUI (server only)\n");
    fprintf(stdout, "  --connect HOST:PORT   Connect TUI to a remote server\n");
    fprintf(stdout, "  --port PORT           OSC server port (default: %s)\n", cfg.oscPort.c_str());
    fprintf(stdout, "  --speed R             Initial playback speed (%.3g..%.3g)\n",
            cfg.minSpeed, cfg.maxSpeed);
    fprintf(stdout, "  --loop A:B            Loop A..B seconds of FILE\n");
    fprintf(stdout, "  --help                Show this help message\n");
    fprintf(stdout, "\nConfig file: %s\n", loopah::Config::configFilePath().c_str());
    fprintf(stdout, "\nExamples:\n");
    fprintf(stdout, "  loopah song.wav                      TUI + server on port %s\n", cfg.oscPort.c_str());
    fprintf(stdout, "  loopah --speed 0.75 --loop 30:45 song.flac\n");
    fprintf(stdout, "  loopah --headless --port 9000        Headless server on port 9000\n");
    fprintf(stdout, "  loopah --connect localhost:7770      TUI-only, connect to remote\n");
}

/// Throttle a main loop iteration to the configured refresh interval
static void sleepRemainder(std::chrono::steady_clock::time_point frameStart, int refreshMs) {
    auto frameEnd = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        frameEnd - frameStart);
    auto sleepTime = std::chrono::milliseconds(refreshMs) - elapsed;
    if (sleepTime.count() > 0) {
        std::this_thread::sleep_for(sleepTime);
    }
}

/// Load FILE from the command line and apply --loop. Problems are reported
/// through report(); playback starts only if the file loaded.
template <typename Report>
static void applyInitialFile(loopah::PlayerEngine& engine, const loopah::Config& cfg,
                             Report report) {
    if (cfg.inputFile.empty()) return;

    auto result = engine.load(cfg.inputFile);
    if (!result.ok()) {
        report(loopah::errorKindName(result.error) + ": " + result.message);
        return;
    }

    if (cfg.loopStartSeconds && cfg.loopEndSeconds) {
        result = engine.setLoopSeconds(*cfg.loopStartSeconds, *cfg.loopEndSeconds, true);
        if (!result.ok()) {
            report(loopah::errorKindName(result.error) + ": " + result.message);
        } else {
            engine.seekSeconds(*cfg.loopStartSeconds);
        }
    }

    result = engine.play();
    if (!result.ok()) {
        report(loopah::errorKindName(result.error) + ": " + result.message);
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Load config file, then apply CLI overrides
    auto cfg = loopah::Config::load();
    int exitCode = 0;
    if (!cfg.parseArgs(argc, argv, exitCode)) {
        if (cfg.showHelp) {
            printUsage(cfg);
        }
        return exitCode;
    }

    // Determine run mode
    RunMode mode = RunMode::Tui;
    if (cfg.headless) {
        mode = RunMode::Headless;
    } else if (!cfg.connectTarget.empty()) {
        mode = RunMode::TuiOnly;
    }

    // --- TUI-only mode (no audio, no engine) ---
    if (mode == RunMode::TuiOnly) {
        // Parse host:port
        auto colonPos = cfg.connectTarget.rfind(':');
        if (colonPos == std::string::npos) {
            fprintf(stderr, "Invalid connect target: %s (expected host:port)\n", cfg.connectTarget.c_str());
            return 1;
        }
        std::string host = cfg.connectTarget.substr(0, colonPos);
        std::string port = cfg.connectTarget.substr(colonPos + 1);

        loopah::OscEngineClient client(host, port);
        if (!client.isValid()) {
            fprintf(stderr, "Failed to create OSC client\n");
            return 1;
        }

        if (!cfg.inputFile.empty()) {
            client.load(cfg.inputFile);
        }

        loopah::Tui tui(client, cfg.seekStepSeconds, cfg.speedStep);
        if (!tui.init()) {
            fprintf(stderr, "Failed to initialize TUI\n");
            return 1;
        }

        tui.addMessage("Connected to " + cfg.connectTarget);
        tui.addMessage("Press 'q' to quit");

        while (g_running) {
            auto frameStart = std::chrono::steady_clock::now();
            if (!tui.update()) break;
            sleepRemainder(frameStart, cfg.tuiRefreshMs);
        }

        tui.shutdown();
        return 0;
    }

    // --- Modes that require audio ---
    juce::ScopedJuceInitialiser_GUI juceInit;
    juce::AudioDeviceManager deviceManager;

    // Set preferred audio backend if specified
    if (!cfg.audioBackend.empty()) {
        juce::String preferredBackend(cfg.audioBackend);
        auto& deviceTypes = deviceManager.getAvailableDeviceTypes();
        bool found = false;
        for (auto* deviceType : deviceTypes) {
            if (deviceType->getTypeName().containsIgnoreCase(preferredBackend)) {
                deviceManager.setCurrentAudioDeviceType(deviceType->getTypeName(), true);
                fprintf(stderr, "Selected audio backend: %s\n", deviceType->getTypeName().toRawUTF8());
                found = true;
                break;
            }
        }
        if (!found) {
            fprintf(stderr, "Warning: %s audio backend not found, using default\n",
                    preferredBackend.toRawUTF8());
        }
    }

    // Output only, stereo
    auto error = deviceManager.initialise(0, 2, nullptr, true);
    if (error.isNotEmpty()) {
        fprintf(stderr, "Audio device error: %s\n", error.toRawUTF8());
        return 1;
    }

    // Apply configured buffer size / sample rate
    if (cfg.bufferSize > 0 || cfg.sampleRate > 0.0) {
        auto setup = deviceManager.getAudioDeviceSetup();
        if (cfg.bufferSize > 0) setup.bufferSize = cfg.bufferSize;
        if (cfg.sampleRate > 0.0) setup.sampleRate = cfg.sampleRate;
        auto setupError = deviceManager.setAudioDeviceSetup(setup, true);
        if (setupError.isNotEmpty()) {
            fprintf(stderr, "Warning: could not apply audio settings: %s\n",
                    setupError.toRawUTF8());
        }
    }

    auto* device = deviceManager.getCurrentAudioDevice();
    if (!device) {
        fprintf(stderr, "No audio device available\n");
        return 1;
    }

    double sampleRate = device->getCurrentSampleRate();
    int bufferSize = device->getCurrentBufferSizeSamples();
    int numOutputChannels = device->getActiveOutputChannels().countNumberOfSetBits();
    if (numOutputChannels < 1) numOutputChannels = 1;
    int outputLatency = device->getOutputLatencyInSamples();

    fprintf(stderr, "Using audio device: %s\n", device->getName().toRawUTF8());
    fprintf(stderr, "  Sample rate: %.0f Hz\n", sampleRate);
    fprintf(stderr, "  Buffer size: %d samples\n", bufferSize);
    fprintf(stderr, "  Output channels: %d\n", numOutputChannels);
    fprintf(stderr, "  Output latency: %d samples (%.1f ms)\n",
            outputLatency, 1000.0 * outputLatency / sampleRate);

    if (cfg.blockFrames < bufferSize) {
        fprintf(stderr, "  Warning: block_frames %d is smaller than the device buffer (%d)\n",
                cfg.blockFrames, bufferSize);
    }

    loopah::PlayerEngine engine(cfg.engineSettings(sampleRate));
    loopah::OscServer oscServer(engine, cfg.oscPort);

    // --- Headless mode (no TUI) ---
    if (mode == RunMode::Headless) {
        engine.setCallbacks(oscServer.engineCallbacks());
        engine.startRendering();

        AudioCallback audioCallback(engine);
        deviceManager.addAudioCallback(&audioCallback);

        if (!oscServer.start()) {
            deviceManager.removeAudioCallback(&audioCallback);
            engine.stopRendering();
            return 1;
        }

        applyInitialFile(engine, cfg, [](const std::string& msg) {
            fprintf(stderr, "%s\n", msg.c_str());
        });

        fprintf(stderr, "Running headless on port %s\n", cfg.oscPort.c_str());
        fprintf(stderr, "Press Ctrl+C to stop\n");

        while (g_running) {
            auto frameStart = std::chrono::steady_clock::now();
            oscServer.pushState();
            sleepRemainder(frameStart, cfg.tuiRefreshMs);
        }

        oscServer.stop();
        deviceManager.removeAudioCallback(&audioCallback);
        engine.stopRendering();
        return 0;
    }

    // --- TUI mode (default): audio + OSC server + TUI ---
    // Client installs the engine callbacks and forwards messages to OSC subscribers
    loopah::LocalEngineClient client(engine, oscServer.engineCallbacks());
    engine.startRendering();

    AudioCallback audioCallback(engine);
    deviceManager.addAudioCallback(&audioCallback);

    if (!oscServer.start()) {
        deviceManager.removeAudioCallback(&audioCallback);
        engine.stopRendering();
        return 1;
    }

    loopah::Tui tui(client, cfg.seekStepSeconds, cfg.speedStep);

    if (!tui.init()) {
        fprintf(stderr, "Failed to initialize TUI\n");
        oscServer.stop();
        deviceManager.removeAudioCallback(&audioCallback);
        engine.stopRendering();
        return 1;
    }

    tui.addMessage("Loopah started - JUCE audio active");
    tui.addMessage("Device: " + device->getName().toStdString());
    {
        char buf[128];
        snprintf(buf, sizeof(buf), "SR: %.0fHz  Buffer: %d  Out: %d  Block: %d",
                 sampleRate, bufferSize, numOutputChannels, cfg.blockFrames);
        tui.addMessage(buf);
    }
    tui.addMessage("OSC server on port " + cfg.oscPort);

    applyInitialFile(engine, cfg, [&tui](const std::string& msg) {
        tui.addMessage(msg);
    });

    tui.addMessage("Press 'q' to quit");

    // Main loop: TUI at ~30fps
    while (g_running) {
        auto frameStart = std::chrono::steady_clock::now();

        if (!tui.update()) {
            break;
        }

        oscServer.pushState();
        sleepRemainder(frameStart, cfg.tuiRefreshMs);
    }

    // Cleanup
    oscServer.stop();
    deviceManager.removeAudioCallback(&audioCallback);
    engine.stopRendering();
    tui.shutdown();

    return 0;
}
