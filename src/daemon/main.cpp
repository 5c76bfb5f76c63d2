/**
 * facewatch daemon
 *
 * Watches a camera stream and raises a notification when a known person
 * stays in view:
 * - Face detection and embedding (ncnn)
 * - Classifier ensemble fusion (OpenCV SVM / kNN)
 * - Temporal debouncing, one notification per appearance
 *
 * Signals:
 *   SIGTERM/SIGINT  stop
 *   SIGHUP          reload classifiers
 */

#include "../config.h"
#include "../logger.h"
#include "../control/control_listener.h"
#include "../notify/notifier.h"
#include "../notify/presence_monitor.h"
#include "../pipeline/pipeline_setup.h"
#include "config_paths.h"
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>
#include <getopt.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
    std::atomic<bool> g_running{true};
    std::atomic<bool> g_reload_classifiers{false};

    void signalHandler(int signal) {
        if (signal == SIGTERM || signal == SIGINT) {
            g_running = false;
        } else if (signal == SIGHUP) {
            g_reload_classifiers = true;
        }
    }

    void setupSignalHandlers() {
        struct sigaction sa;
        sa.sa_handler = signalHandler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;

        sigaction(SIGTERM, &sa, nullptr);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGHUP, &sa, nullptr);
    }

    void daemonize() {
        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Failed to fork daemon process" << std::endl;
            exit(EXIT_FAILURE);
        }
        if (pid > 0) {
            exit(EXIT_SUCCESS);
        }

        if (setsid() < 0) {
            exit(EXIT_FAILURE);
        }

        // Fork again to prevent acquiring controlling terminal
        pid = fork();
        if (pid < 0) {
            exit(EXIT_FAILURE);
        }
        if (pid > 0) {
            exit(EXIT_SUCCESS);
        }

        umask(0);

        if (chdir("/") < 0) {
            exit(EXIT_FAILURE);
        }

        close(STDIN_FILENO);
        close(STDOUT_FILENO);
        close(STDERR_FILENO);
    }

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [OPTIONS]\n"
                  << "\nOptions:\n"
                  << "  -c, --config PATH    Configuration file path (default: " << CONFIG_DIR << "/facewatch.conf)\n"
                  << "  -d, --daemon         Run as daemon (fork to background)\n"
                  << "  -h, --help           Show this help message\n"
                  << "  -v, --verbose        Enable verbose logging\n"
                  << "      --debug          Per-classifier debug lines for every face\n"
                  << "\nSignals:\n"
                  << "  SIGTERM/SIGINT       Graceful shutdown\n"
                  << "  SIGHUP               Reload classifiers\n"
                  << std::endl;
    }

    struct DaemonOptions {
        std::string config_path = std::string(CONFIG_DIR) + "/facewatch.conf";
        bool daemon_mode = false;
        bool verbose = false;
        bool debug = false;
    };

    DaemonOptions parseArguments(int argc, char* argv[]) {
        DaemonOptions options;

        static struct option long_options[] = {
            {"config",  required_argument, nullptr, 'c'},
            {"daemon",  no_argument,       nullptr, 'd'},
            {"help",    no_argument,       nullptr, 'h'},
            {"verbose", no_argument,       nullptr, 'v'},
            {"debug",   no_argument,       nullptr, 'D'},
            {nullptr, 0, nullptr, 0}
        };

        int opt;
        while ((opt = getopt_long(argc, argv, "c:dhv", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'c':
                    options.config_path = optarg;
                    break;
                case 'd':
                    options.daemon_mode = true;
                    break;
                case 'v':
                    options.verbose = true;
                    break;
                case 'D':
                    options.debug = true;
                    break;
                case 'h':
                    printUsage(argv[0]);
                    exit(EXIT_SUCCESS);
                default:
                    printUsage(argv[0]);
                    exit(EXIT_FAILURE);
            }
        }

        return options;
    }

    bool loadConfiguration(const std::string& config_path) {
        auto& config = facewatch::Config::getInstance();
        if (!config.load(config_path)) {
            facewatch::Logger::getInstance().error("Failed to load configuration from: " + config_path);
            return false;
        }

        facewatch::Logger::getInstance().info("Configuration loaded from: " + config_path);
        return true;
    }

    // Numeric device ("0") opens a V4L2 index, anything else a path or URL
    bool openCapture(cv::VideoCapture& capture, const std::string& device, int width, int height, int fps) {
        bool numeric = !device.empty() &&
            std::all_of(device.begin(), device.end(), [](unsigned char c) { return std::isdigit(c); });
        bool opened = numeric ? capture.open(std::stoi(device), cv::CAP_V4L2)
                              : capture.open(device);
        if (!opened) {
            return false;
        }
        capture.set(cv::CAP_PROP_FRAME_WIDTH, width);
        capture.set(cv::CAP_PROP_FRAME_HEIGHT, height);
        capture.set(cv::CAP_PROP_FPS, fps);
        return true;
    }

    std::chrono::milliseconds secondsToMillis(double seconds) {
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
}

int main(int argc, char* argv[]) {
    auto options = parseArguments(argc, argv);

    auto& logger = facewatch::Logger::getInstance();

    // Daemonize if requested (before logging setup)
    if (options.daemon_mode) {
        daemonize();
    }

    logger.info("facewatch daemon " VERSION " starting...");

    if (!loadConfiguration(options.config_path)) {
        return EXIT_FAILURE;
    }

    auto& config = facewatch::Config::getInstance();

    std::string log_file = config.getString("logging", "log_file").value_or("/var/log/facewatch.log");
    std::string log_level_str = config.getString("logging", "log_level").value_or("INFO");

    bool use_syslog = config.getBool("logging", "syslog").value_or(false);

    if (options.daemon_mode) {
        if (use_syslog) {
            logger.setSyslogOutput("facewatchd");
        } else {
            logger.setLogFile(log_file);
        }
        if (auto max_kb = config.getInt("logging", "max_size_kb")) {
            logger.setMaxFileSize(static_cast<size_t>(*max_kb) * 1024);
        }
    }
    logger.setLogLevel(options.verbose ? facewatch::LogLevel::DEBUG : facewatch::parseLogLevel(log_level_str));

    std::string sink = "console";
    if (logger.sink() == facewatch::LogSink::SYSLOG) {
        sink = "syslog";
    } else if (logger.sink() == facewatch::LogSink::FILE) {
        sink = "file=" + log_file;
    }
    logger.info("Logging configured: " + sink +
                ", level=" + (options.verbose ? std::string("DEBUG") : log_level_str));

    bool debug = options.debug || config.getBool("recognition", "debug").value_or(false);

    facewatch::PipelineComponents components;
    if (!facewatch::buildPipeline(components, debug)) {
        logger.error("Failed to set up the recognition pipeline");
        return EXIT_FAILURE;
    }
    facewatch::FramePipeline& pipeline = *components.pipeline;
    facewatch::EnsembleStore& store = *components.store;

    facewatch::DebounceConfig debounce;
    debounce.notify_period = secondsToMillis(config.getDouble("notify", "period_seconds").value_or(3.0));
    debounce.notify_probability = config.getDouble("notify", "probability").value_or(0.5);
    debounce.stay_notified = secondsToMillis(config.getDouble("notify", "stay_seconds").value_or(120.0));
    std::string mode = config.getString("notify", "mode").value_or("any");

    facewatch::PresenceMonitor monitor(debounce, facewatch::parseTrackingMode(mode));
    facewatch::PrintNotifier notifier(std::cout, config.getString("notify", "snapshot_dir").value_or(""));

    logger.info("Notification configuration:");
    logger.info("  Period: " + std::to_string(debounce.notify_period.count()) + "ms");
    logger.info("  Probability: " + std::to_string(debounce.notify_probability));
    logger.info("  Stay notified: " + std::to_string(debounce.stay_notified.count()) + "ms");
    logger.info("  Mode: " + mode);

    // Command channel
    int frames_processed = 0;
    double current_fps = 0.0;

    facewatch::ControlDispatcher dispatcher;
    dispatcher.on("ping", [](const facewatch::ControlCommand&) {
        return facewatch::ControlReply::success("pong");
    });
    dispatcher.on("reload", [&store](const facewatch::ControlCommand&) {
        if (!store.reload()) {
            return facewatch::ControlReply::failure("reload failed, previous classifiers kept");
        }
        return facewatch::ControlReply::success(std::to_string(store.current()->size()) + " classifiers");
    });
    dispatcher.on("debug", [&pipeline](const facewatch::ControlCommand& command) {
        if (command.argument == "on") {
            pipeline.setDebug(true);
        } else if (command.argument == "off") {
            pipeline.setDebug(false);
        } else {
            return facewatch::ControlReply::failure("usage: debug on|off");
        }
        return facewatch::ControlReply::success("debug " + command.argument);
    });
    dispatcher.on("status", [&](const facewatch::ControlCommand&) {
        auto ensemble = store.current();
        std::ostringstream out;
        out << "classifiers=" << ensemble->size()
            << " classes=" << ensemble->labels().size()
            << " debug=" << (pipeline.debug() ? "on" : "off")
            << " frames=" << frames_processed
            << " fps=" << static_cast<int>(current_fps);
        return facewatch::ControlReply::success(out.str());
    });

    facewatch::ControlListener listener;
    if (config.getBool("control", "enabled").value_or(true)) {
        int port = config.getInt("control", "port").value_or(facewatch::ControlListener::DEFAULT_PORT);
        if (!listener.open("127.0.0.1", port)) {
            return EXIT_FAILURE;
        }
    }

    // Camera
    std::string device = config.getString("camera", "device").value_or("0");
    int width = config.getInt("camera", "width").value_or(640);
    int height = config.getInt("camera", "height").value_or(480);
    int fps = config.getInt("camera", "fps").value_or(30);

    cv::VideoCapture capture;
    if (!openCapture(capture, device, width, height, fps)) {
        logger.error("Cannot open video source: " + device);
        return EXIT_FAILURE;
    }
    logger.info("Video source opened: " + device);

    setupSignalHandlers();

    logger.info("facewatch daemon started successfully");

    cv::Mat frame;
    int read_failures = 0;
    int frames_since_stats = 0;
    auto stats_start = std::chrono::steady_clock::now();

    while (g_running) {
        if (g_reload_classifiers.exchange(false)) {
            logger.info("Received reload signal");
            if (!store.reload()) {
                logger.warning("Classifier reload failed, previous classifiers kept");
            }
        }

        if (!capture.read(frame) || frame.empty()) {
            if (++read_failures % 50 == 0) {
                logger.warning("No frames from " + device + " (" + std::to_string(read_failures) + " attempts), reopening");
                capture.release();
                if (!openCapture(capture, device, width, height, fps)) {
                    logger.error("Cannot reopen video source: " + device);
                }
            }
            listener.serveOne(dispatcher);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        read_failures = 0;

        auto now = std::chrono::steady_clock::now();
        facewatch::FrameResult result = pipeline.process(frame);
        frames_processed++;
        frames_since_stats++;

        if (pipeline.debug()) {
            for (const auto& verdict : result.verdicts) {
                for (const auto& line : verdict.debug_lines) {
                    logger.debug(line);
                }
            }
        }

        monitor.observe(result, frame, now);
        for (const auto& pending : monitor.collectNotifications()) {
            notifier.notify(facewatch::makeNotification(pending.name, pending.labels, pending.snapshot));
            logger.auditNotification(pending.name, pending.confidence, !pending.snapshot.empty());
        }

        listener.serveOne(dispatcher);

        // Frame rate, logged once a minute
        double elapsed = std::chrono::duration<double>(now - stats_start).count();
        if (elapsed >= 1.0) {
            current_fps = frames_since_stats / elapsed;
        }
        if (elapsed >= 60.0) {
            logger.info("Processing " + std::to_string(static_cast<int>(current_fps)) + " fps, " +
                        std::to_string(frames_processed) + " frames total");
            frames_since_stats = 0;
            stats_start = now;
        }
    }

    logger.info("Shutting down facewatch daemon...");
    listener.close();
    capture.release();
    logger.info("Daemon stopped");

    return EXIT_SUCCESS;
}
