#include "app/Application.hpp"
#include "ui/TerminalWindow.hpp"
#include "utils/Config.hpp"
#include "utils/Errors.hpp"
#include "utils/Logging.hpp"
#include <spdlog/spdlog.h>
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef PEQUOD_VERSION
#define PEQUOD_VERSION "1.0.0"
#endif

namespace Pequod {

namespace {

int parsePositive(const char* text, const char* option) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || value < 1 || value > 36500) {
        throw std::invalid_argument(std::string("--") + option + " expects a positive number, got '" + text + "'");
    }
    return static_cast<int>(value);
}

}

Application::Application() = default;

Application::~Application() {
    shutdown();
}

void Application::printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--db-path PATH] [--max-ttl-days N] [--config FILE]"
              << " [--log-level trace|debug|info|warn|error|off] [--help] [--version]\n";
}

CommandLine Application::parseCommandLine(int argc, char* argv[]) {
    const option longOpts[] = {
        {"db-path", required_argument, nullptr, 'd'},
        {"max-ttl-days", required_argument, nullptr, 't'},
        {"config", required_argument, nullptr, 'c'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };

    CommandLine cmd;
    optind = 1;
    opterr = 0;
    int opt = 0;
    int idx = 0;
    while ((opt = getopt_long(argc, argv, "hv", longOpts, &idx)) != -1) {
        switch (opt) {
            case 'd': cmd.dbPath = optarg; break;
            case 't': cmd.maxTtlDays = parsePositive(optarg, "max-ttl-days"); break;
            case 'c': cmd.configPath = optarg; break;
            case 'l':
                if (!parseLogLevel(optarg)) throw std::invalid_argument(std::string("unknown log level '") + optarg + "'");
                cmd.logLevel = optarg;
                break;
            case 'h': cmd.help = true; break;
            case 'v': cmd.version = true; break;
            default: {
                std::string bad = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
                throw std::invalid_argument("unrecognized or incomplete option '" + bad + "'");
            }
        }
    }
    if (optind < argc) {
        throw std::invalid_argument(std::string("unexpected argument '") + argv[optind] + "'");
    }
    return cmd;
}

int Application::run(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "pequod: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }
    if (cmd.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (cmd.version) {
        std::cout << "pequod " << PEQUOD_VERSION << std::endl;
        return 0;
    }

    Config& config = Config::getInstance();
    if (!cmd.configPath.empty()) config.setConfigPath(cmd.configPath);
    if (!config.load()) {
        std::cerr << "pequod: ignoring unreadable config " << config.getConfigPath() << "\n";
    }
    if (!cmd.dbPath.empty()) config.setDbPath(cmd.dbPath);
    if (cmd.maxTtlDays > 0) config.setMaxTtlDays(cmd.maxTtlDays);
    if (!cmd.logLevel.empty()) config.setLogLevel(cmd.logLevel);

    Config::ensureDirectory(Config::getDataDir());
    auto level = parseLogLevel(config.getLogLevel());
    if (!level) {
        std::cerr << "pequod: unknown log level '" << config.getLogLevel() << "' in config, using info\n";
        level = spdlog::level::info;
    }
    initLogging(config.getLogPath(), *level);

    if (!openStore(config.getDbPath(), config.getMaxTtlDays())) return 1;

    transport_ = std::make_unique<CurlTransport>(config.getUserAgent());
    SyncOptions options;
    options.concurrency = config.getSyncConcurrency();
    options.feedTimeoutSeconds = config.getFeedTimeoutSeconds();
    options.maxEntryAgeSeconds = static_cast<Timestamp>(config.getMaxTtlDays()) * 24 * 60 * 60;
    engine_ = std::make_unique<SyncEngine>(*store_, *transport_, parser_, options);
    resolver_ = std::make_unique<ContentResolver>(*transport_, extractor_, config.getContentTimeoutSeconds());
    runner_ = std::make_unique<ThreadBackgroundRunner>();
    controller_ = std::make_unique<ViewController>(*store_, *engine_, *resolver_, browser_, *runner_);

    runLoop();
    shutdown();
    spdlog::info("pequod exiting");
    return 0;
}

bool Application::openStore(const std::string& dbPath, int maxTtlDays) {
    size_t slash = dbPath.rfind('/');
    if (slash != std::string::npos && slash > 0) Config::ensureDirectory(dbPath.substr(0, slash));

    try {
        store_ = std::make_unique<FeedStore>(dbPath);
        Timestamp cutoff = nowTimestamp() - static_cast<Timestamp>(maxTtlDays) * 24 * 60 * 60;
        store_->expireEntries(cutoff);
    } catch (const StorageError& e) {
        spdlog::critical("Cannot open database {}: {}", dbPath, e.what());
        std::cerr << "pequod: cannot open database " << dbPath << ": " << e.what() << std::endl;
        return false;
    }
    spdlog::info("Using database {}", dbPath);
    return true;
}

void Application::runLoop() {
    TerminalWindow window;
    controller_->setViewport(window.width(), window.height());
    controller_->reload();

    bool dirty = true;
    while (true) {
        if (dirty) {
            window.draw(controller_->snapshot());
            dirty = false;
        }

        if (auto key = window.readKey()) {
            if (key->code == Keys::Resize) {
                controller_->setViewport(window.width(), window.height());
            } else if (controller_->handleKey(*key)) {
                break;
            }
            dirty = true;
        } else if (controller_->isBusy()) {
            controller_->tick();
            dirty = true;
        }

        if (controller_->pumpEvents()) dirty = true;
    }
}

void Application::shutdown() {
    if (engine_) engine_->cancel();
    if (runner_) runner_->joinAll();
}

}
