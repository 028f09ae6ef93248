#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "core/SessionConfig.hpp"
#include "core/Session.hpp"
#include "core/ReplayLog.hpp"
#include "core/FrameSource.hpp"
#include "core/InputLoop.hpp"
#include "core/FrameLoop.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

struct Options {
    std::string replayPath;
    std::string configPath;
    bool realtime = false;
    bool osc = false;
    std::string oscHost;
    std::string oscPort;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <replay-file> [--config file] [--realtime] [--osc host:port]\n";
}

bool parseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--realtime") {
            opts.realtime = true;
        } else if (arg == "--osc" && i + 1 < argc) {
            std::string target = argv[++i];
            auto colon = target.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
                return false;
            }
            opts.osc = true;
            opts.oscHost = target.substr(0, colon);
            opts.oscPort = target.substr(colon + 1);
        } else if (!arg.empty() && arg[0] != '-' && opts.replayPath.empty()) {
            opts.replayPath = arg;
        } else {
            return false;
        }
    }
    return !opts.replayPath.empty();
}

void runRealtime(core::Session& session, const core::ReplayLog& replay,
                 std::shared_ptr<core::OscQueue> oscQueue) {
    auto frameQueue = std::make_shared<core::FrameQueue>();
    auto source = std::make_shared<core::ReplayFrameSource>(replay.frames, true);

    core::FrameLoop frameLoop(session, frameQueue, oscQueue);
    core::InputLoop inputLoop(source, frameQueue);

    frameLoop.start();
    inputLoop.start();

    // Orchestrator
    while (g_running) {
        if (inputLoop.hasError()) {
            core::Logger::warn("InputLoop reported critical error. Stopping session...");
            break;
        }
        if (frameLoop.sessionFinished()) break;
        if (inputLoop.isFinished() && frameQueue->empty()) break;

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    core::Logger::info("Stopping modules...");
    inputLoop.stop();
    frameLoop.stop();
    core::Logger::info("FrameLoop: ", frameLoop.framesSkipped(), " frames skipped behind, ",
                       frameLoop.currentFps(), " fps");
}

void runDeterministic(core::Session& session, const core::ReplayLog& replay,
                      std::shared_ptr<core::OscQueue> oscQueue) {
    // Same FrameLoop, stepped by hand: one frame in, one frame processed
    auto frameQueue = std::make_shared<core::FrameQueue>();
    core::FrameLoop frameLoop(session, frameQueue, oscQueue);

    for (const auto& frame : replay.frames) {
        if (!g_running || session.state() != core::Session::State::Running) break;
        if (!frameQueue->try_push(frame)) break;
        frameLoop.step();
    }
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        core::SessionConfig config;
        if (!opts.configPath.empty()) {
            config = core::SessionConfig::loadFromFile(opts.configPath);
        }
        if (opts.osc) {
            config.oscHost = opts.oscHost;
            config.oscPort = opts.oscPort;
        }
        core::Logger::setLevel(config.logLevel);

        core::Logger::info("Starting MaiTrainer...");
        core::ReplayLog replay = core::ReplayLog::loadFromFile(opts.replayPath);

        core::Session session(config);
        if (!replay.calibration.empty() && !session.calibrate(replay.calibration)) {
            if (!config.allowUncalibrated) return 1;
            core::Logger::warn("Continuing with uncalibrated scaling");
        }
        if (!session.loadPattern(replay.notes)) {
            return 1;
        }

        core::TimestampMs origin = replay.frames.empty() ? 0.0 : replay.frames.front().timestampMs;
        session.start(origin);

        std::shared_ptr<core::OscQueue> oscQueue;
        std::unique_ptr<net::OscSender> oscSender;
        if (opts.osc) {
            oscQueue = std::make_shared<core::OscQueue>();
            oscSender = std::make_unique<net::OscSender>(oscQueue, config.oscHost, config.oscPort);
            if (!oscSender->start()) {
                return 1;
            }
        }

        if (opts.realtime) {
            runRealtime(session, replay, oscQueue);
        } else {
            runDeterministic(session, replay, oscQueue);
        }

        if (oscSender) {
            oscSender->stop();
        }

        const auto& stats = session.stats();
        core::ScoreSummary summary = session.end();
        core::Logger::info("Frames: ", stats.framesProcessed, " processed, ", stats.staleFrames, " stale, ",
                           stats.lowConfidencePoints, " low-confidence points, ",
                           stats.unmappablePoints, " unmappable points, ", stats.events, " events");

        std::cout << summary.toString() << std::endl;
    } catch (const std::exception& e) {
        core::Logger::error("Fatal error: ", e.what());
        return 1;
    }

    core::Logger::info("MaiTrainer stopped cleanly.");
    return 0;
}
